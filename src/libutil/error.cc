#include "lbrun/util/error.hh"

namespace lbrun {

std::string renderErrorInfo(const ErrorInfo & ei)
{
    const char * prefix;
    switch (ei.level) {
    case lvlError:
        prefix = ANSI_RED "error:";
        break;
    case lvlWarn:
        prefix = ANSI_WARNING "warning:";
        break;
    case lvlNotice:
        prefix = ANSI_RED "note:";
        break;
    case lvlDebug:
    case lvlVomit:
        prefix = ANSI_WARNING "debug:";
        break;
    default:
        prefix = ANSI_GREEN "info:";
    }
    return fmt("%s" ANSI_NORMAL " %s", prefix, ei.msg.str());
}

} // namespace lbrun
