#pragma once

#include "general/errors_forward.hpp"
#include <cstdint>
////////////////////////////////////
// LIST OF ERROR CODES            //
////////////////////////////////////
// Codes describe why a decode, batch transition or settlement
// step did not go through.

// LIBUV ERROR CODES
// -----------------
// Libuv error codes are negative and are returned by libuv
// routines (timers, signals).

// ADDITIONAL ERROR CODES
// -------------------
// Codec, range [1-99]
// Batch and settlement, range [100-199]
// Ledger and transport, range [200-299]
// Input parsing, range [300-399]
// Process, range [1000-1999]
#define VEILBATCH_ERRNO_MAP(XX)                                                     \
    XX(0, ENOERROR, "no error")                                                     \
    /*001 - 099: Codec*/                                                            \
    XX(1, ETYPEMISMATCH, "ciphertext type does not match expected type")            \
    XX(2, EUNSUPPORTEDTAG, "unsupported type tag")                                  \
    XX(3, EDEPRECATEDTAG, "type tag Uint256 is deprecated and rejected")            \
    XX(4, EDECRYPTUNAVAIL, "decryption service unavailable")                        \
    XX(5, EMALFORMED, "malformed encrypted value")                                  \
    XX(6, ESCHEMALEN, "argument count does not match calldata schema")              \
    /*100 - 199: Batch and settlement*/                                             \
    XX(100, EBATCHSTATE, "batch state does not allow this transition")              \
    XX(101, EQUORUM, "quorum not met")                                              \
    XX(102, EALREADYSETTLED, "batch already settled")                               \
    XX(103, ENOTCOMMITTEE, "operator not in committee for batch")                   \
    XX(104, EINVSIG, "invalid signature")                                           \
    XX(105, EUNKNOWNHASH, "settlement hash was not proposed")                       \
    XX(106, EEXPIRED, "intent deadline expired")                                    \
    XX(107, EBADAMOUNT, "invalid amount")                                           \
    XX(108, ESAMETOKEN, "token in and token out must differ")                       \
    XX(109, ENOTPRIVILEGED, "caller is not privileged")                             \
    XX(110, ENOTIDLE, "batch is not idle long enough")                              \
    XX(111, EINTERVAL, "batch interval not reached")                                \
    XX(112, EEMPTYBATCH, "batch has no intents")                                    \
    XX(113, EBATCHID, "settlement batch id mismatch")                               \
    /*200 - 299: Ledger and transport*/                                             \
    XX(200, ELEDGERREJECTED, "ledger rejected settlement")                          \
    XX(201, ENETWORK, "transient network error")                                    \
    XX(202, ENOTFOUND, "not found")                                                 \
    XX(203, EMSGINTEGRITY, "message integrity check failed")                        \
    XX(204, EDBCORRUPT, "ledger database corrupted")                                \
    /*300 - 399: Input parsing*/                                                    \
    XX(300, EINV_HEX, "cannot parse hexadecimal input")                             \
    XX(301, EINV_DECIMAL, "cannot parse decimal input")                             \
    XX(302, EBADPUBKEY, "invalid public key")                                       \
    XX(303, EBADPRIVKEY, "invalid private key")                                     \
    XX(304, ECORRUPTEDSIG, "corrupted signature")                                   \
    XX(305, EPARSESIG, "cannot parse signature")                                    \
    XX(306, EBADADDRESS, "invalid address")                                         \
    XX(1000, ESIGTERM, "received SIGTERM")                                          \
    XX(1001, ESIGHUP, "received SIGHUP")                                            \
    XX(1002, ESIGINT, "received SIGINT")                                            \
    XX(2000, EBUG, "bug-related error")

#define ERR_DEFINE(code, name, _) constexpr int32_t name = code;
VEILBATCH_ERRNO_MAP(ERR_DEFINE)
#undef ERR_DEFINE
