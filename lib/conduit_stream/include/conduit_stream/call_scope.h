#ifndef CONDUIT_STREAM_CALL_SCOPE_H
#define CONDUIT_STREAM_CALL_SCOPE_H

#include <map>
#include <string>

#include <absl/time/time.h>

namespace conduit_stream {

    using Metadata = std::multimap<std::string,std::string>;

    /**
     * The request scope of a loopback call. Loopback streams have no deadline and cannot be
     * cancelled through their scope, so every scope is a background scope; closing a stream
     * half is the only way to cancel a transfer.
     */
    class CallScope {
    public:
        static CallScope background();

        bool isCancelled() const;
        absl::Time getDeadline() const;

    private:
        CallScope() = default;
    };
}

#endif // CONDUIT_STREAM_CALL_SCOPE_H
