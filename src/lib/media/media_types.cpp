#include "vmedia/media/media_types.h"

namespace vmedia::media {

const char* to_string(MediaError e) noexcept
{
    switch (e) {
        case MediaError::None:           return "ok";
        case MediaError::NotFound:       return "not found";
        case MediaError::FetchFailed:    return "fetch failed";
        case MediaError::InvalidRequest: return "invalid request";
        case MediaError::InternalError:  return "internal error";
    }
    return "unknown";
}

} // namespace vmedia::media
