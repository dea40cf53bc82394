#include "ProxyError.hpp"

const char* describe(ProxyError error) {
    switch (error) {
        case ProxyError::None:                   return "ok";
        case ProxyError::ListenFailure:          return "listen failure";
        case ProxyError::AcceptFailure:          return "accept failure";
        case ProxyError::ClientReadFailure:      return "client read failed";
        case ProxyError::MissingRequestLine:     return "missing request line";
        case ProxyError::MissingMethod:          return "missing method";
        case ProxyError::MissingTarget:          return "missing target";
        case ProxyError::UnknownMethod:          return "unknown method";
        case ProxyError::MalformedUrl:           return "malformed URL";
        case ProxyError::MalformedConnectTarget: return "malformed CONNECT target";
        case ProxyError::MissingHost:            return "missing host";
        case ProxyError::MissingPort:            return "missing port";
        case ProxyError::OriginUnreachable:      return "origin unreachable";
        case ProxyError::HandshakeWriteFailed:   return "handshake write failed";
        case ProxyError::RelayIOFailure:         return "relay I/O failure";
        case ProxyError::RelayTimeout:           return "relay idle timeout";
    }
    return "unknown error";
}

bool isParseFailure(ProxyError error) {
    switch (error) {
        case ProxyError::MissingRequestLine:
        case ProxyError::MissingMethod:
        case ProxyError::MissingTarget:
        case ProxyError::UnknownMethod:
        case ProxyError::MalformedUrl:
        case ProxyError::MalformedConnectTarget:
        case ProxyError::MissingHost:
        case ProxyError::MissingPort:
            return true;
        default:
            return false;
    }
}
