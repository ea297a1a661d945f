#include "cr/model.hpp"

namespace cr {

const char* error_kind_str(CaptureErrorKind kind)
{
    switch (kind)
    {
        case CaptureErrorKind::None: return "ok";
        case CaptureErrorKind::NotDiscovered: return "not_discovered";
        case CaptureErrorKind::Timeout: return "timeout";
        case CaptureErrorKind::ConnectionFailed: return "connection_failed";
        case CaptureErrorKind::RemoteHttpError: return "remote_http_error";
        case CaptureErrorKind::EmptyBody: return "empty_body";
        case CaptureErrorKind::UnexpectedContentType: return "unexpected_content_type";
        case CaptureErrorKind::PersistenceFailure: return "persistence_failure";
        case CaptureErrorKind::InternalError: return "internal_error";
    }
    return "internal_error";
}

} // namespace cr
