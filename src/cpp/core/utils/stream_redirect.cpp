#include "steward/utils/stream_redirect.h"

namespace steward {
namespace utils {

ScopedStreamRedirect::ScopedStreamRedirect(std::ostream& from, std::ostream& to)
    : from_(from), saved_(from.rdbuf(to.rdbuf())), original_(saved_) {
}

ScopedStreamRedirect::~ScopedStreamRedirect() {
    from_.flush();
    original_.flush();
    from_.rdbuf(saved_);
}

} // namespace utils
} // namespace steward
