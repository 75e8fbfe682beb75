#ifndef CONDUIT_PLUGIN_TEST_MOCKS_H
#define CONDUIT_PLUGIN_TEST_MOCKS_H

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <conduit_plugin/abstract_storage_plugin.h>

class MockStoragePlugin : public conduit_plugin::AbstractStoragePlugin {
public:
    MOCK_METHOD (
        tempo_utils::Status,
        getObject,
        (const conduit_storage::GetObjectRequest &, grpc::ServerWriterInterface<conduit_storage::GetObjectResponse> *),
        (override));
    MOCK_METHOD (
        tempo_utils::Status,
        putObject,
        (grpc::ServerReaderInterface<conduit_storage::PutObjectRequest> *, conduit_storage::PutObjectResponse *),
        (override));
};

class MockObjectWriter : public grpc::ServerWriterInterface<conduit_storage::GetObjectResponse> {
public:
    MOCK_METHOD (
        void,
        SendInitialMetadata,
        (),
        (override));
    MOCK_METHOD (
        bool,
        Write,
        (const conduit_storage::GetObjectResponse &, grpc::WriteOptions),
        (override));
};

class MockUploadReader : public grpc::ServerReaderInterface<conduit_storage::PutObjectRequest> {
public:
    MOCK_METHOD (
        void,
        SendInitialMetadata,
        (),
        (override));
    MOCK_METHOD (
        bool,
        NextMessageSize,
        (uint32_t *),
        (override));
    MOCK_METHOD (
        bool,
        Read,
        (conduit_storage::PutObjectRequest *),
        (override));
};

#endif // CONDUIT_PLUGIN_TEST_MOCKS_H
