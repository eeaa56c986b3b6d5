#pragma once

#include <ostream>

namespace steward {
namespace utils {

// Routes everything written to `from` into `to` until destroyed. The CLI uses
// it in --json mode so component logs land on stderr and stdout carries only
// the JSON result, written through original().
class ScopedStreamRedirect {
public:
    ScopedStreamRedirect(std::ostream& from, std::ostream& to);
    ~ScopedStreamRedirect();

    ScopedStreamRedirect(const ScopedStreamRedirect&) = delete;
    ScopedStreamRedirect& operator=(const ScopedStreamRedirect&) = delete;

    // Writes to where `from` pointed before the redirect
    std::ostream& original() { return original_; }

private:
    std::ostream& from_;
    std::streambuf* saved_;
    std::ostream original_;
};

} // namespace utils
} // namespace steward
