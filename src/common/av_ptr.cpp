#include <chatmedia/common/av_ptr.h>

extern "C" {
#include <libavutil/log.h>
}

#include <mutex>

namespace chatmedia::av {

void quietLogging() {
    static std::once_flag once;
    std::call_once(once, [] { av_log_set_level(AV_LOG_QUIET); });
}

} // namespace chatmedia::av
