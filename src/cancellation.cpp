#include <scribe/cancellation.h>

#include <scribe/errors.h>

namespace scribe {

void CancellationToken::ThrowIfCancelled(const std::string &where) const {
  if (IsCancelled()) {
    throw CancelledError("Run cancelled before " + where);
  }
}

} // namespace scribe
