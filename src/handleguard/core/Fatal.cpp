#include <handleguard/core/Fatal.hpp>

#include <cstdio>
#include <cstdlib>

namespace HG {

void FatalError(std::string_view reason) noexcept {
    // Written synchronously: the logger's queue would be lost on abort.
    std::fputs("handleguard fatal: ", stderr);
    std::fwrite(reason.data(), 1, reason.size(), stderr);
    std::fputc('\n', stderr);
    std::fflush(stderr);
    std::abort();
}

} // namespace HG
