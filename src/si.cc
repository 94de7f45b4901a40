#include <cstring>
#include <jailer/concat_tostr.hh>
#include <jailer/si.hh>
#include <sys/wait.h>

namespace jailer {

std::string Si::description() const {
    auto signal_description = [](const char* prefix, int signum) {
        const char* abbrev = sigabbrev_np(signum);
        const char* desc = sigdescr_np(signum);
        if (abbrev and desc) {
            return concat_tostr(prefix, " SIG", abbrev, " - ", desc);
        }
        if (abbrev) {
            return concat_tostr(prefix, " SIG", abbrev);
        }
        return concat_tostr(prefix, " with number ", signum);
    };
    switch (code) {
    case CLD_EXITED: return concat_tostr("exited with ", status);
    case CLD_KILLED: return signal_description("killed by signal", status);
    case CLD_DUMPED: return signal_description("killed and dumped by signal", status);
    default: break;
    }
    return concat_tostr("unable to describe (code ", code, ", status ", status, ')');
}

bool Si::exited() const noexcept { return code == CLD_EXITED; }

bool Si::killed_by_signal() const noexcept { return code == CLD_KILLED or code == CLD_DUMPED; }

} // namespace jailer
