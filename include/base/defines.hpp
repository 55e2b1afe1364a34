#ifndef _BASE_DEFINES_H_
#define _BASE_DEFINES_H_

#ifndef JINGLESDP_CPP_EXPORT
#define JINGLESDP_CPP_EXPORT
#endif

// Line terminator of the SDP wire format.
constexpr const char* kSdpEol = "\r\n";

#endif
