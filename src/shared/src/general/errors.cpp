#include "errors.hpp"
#ifndef DISABLE_LIBUV
#include <uv.h>
#endif

#define STRERROR_GEN(code, name, str) \
    case code:                        \
        return str;
const char* Error::strerror() const
{
    switch (code) {
        VEILBATCH_ERRNO_MAP(STRERROR_GEN)
    }
#ifndef DISABLE_LIBUV
    if (code < 0)
        return uv_strerror(code);
#endif
    return "unknown error";
}
#undef STRERROR_GEN

#define ERR_NAME_GEN(code, name, _) \
    case code:                      \
        return #name;
const char* Error::err_name() const
{

    switch (code) {
        VEILBATCH_ERRNO_MAP(ERR_NAME_GEN)
    }
#ifndef DISABLE_LIBUV
    if (code < 0)
        return uv_err_name(code);
#endif
    return "unknown";
#undef ERR_NAME_GEN
}

std::string Error::format() const { return std::string(err_name()) + " (" + strerror() + ")"; }

bool Error::is_transient() const
{
    switch (code) {
    case EDECRYPTUNAVAIL:
    case ENETWORK:
        return true;
    default:
        return false;
    }
}
