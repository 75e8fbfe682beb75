
#include <conduit_stream/call_scope.h>

conduit_stream::CallScope
conduit_stream::CallScope::background()
{
    return CallScope();
}

bool
conduit_stream::CallScope::isCancelled() const
{
    return false;
}

absl::Time
conduit_stream::CallScope::getDeadline() const
{
    return absl::InfiniteFuture();
}
