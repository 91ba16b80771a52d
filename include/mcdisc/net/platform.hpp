/**
 * @file platform.hpp
 * @brief Socket headers and handle helpers for Winsock and POSIX.
 *
 * @copyright Copyright (c) 2024 mcdisc Contributors
 * @license MIT License
 */

#pragma once

#ifdef _WIN32
    #ifndef WIN32_LEAN_AND_MEAN
        #define WIN32_LEAN_AND_MEAN
    #endif
    #ifndef NOMINMAX
        #define NOMINMAX
    #endif
    #include <WinSock2.h>
    #include <WS2tcpip.h>
#else
    #include <arpa/inet.h>
    #include <errno.h>
    #include <netinet/in.h>
    #include <sys/select.h>
    #include <sys/socket.h>
    #include <sys/types.h>
    #include <unistd.h>
#endif

namespace mcdisc {
namespace net {

#ifdef _WIN32
using SocketHandle = SOCKET;
constexpr SocketHandle INVALID_SOCKET_HANDLE = INVALID_SOCKET;

inline int getLastSocketError() { return WSAGetLastError(); }
inline void closeSocketHandle(SocketHandle handle) { ::closesocket(handle); }

/**
 * @brief Start Winsock once per process. Safe to call from every socket.
 */
inline bool ensureSocketsInitialized() {
    struct Session {
        bool ok;
        Session() {
            WSADATA data;
            ok = WSAStartup(MAKEWORD(2, 2), &data) == 0;
        }
        ~Session() {
            if (ok) {
                WSACleanup();
            }
        }
    };
    static Session session;
    return session.ok;
}
#else
using SocketHandle = int;
constexpr SocketHandle INVALID_SOCKET_HANDLE = -1;

inline int getLastSocketError() { return errno; }
inline void closeSocketHandle(SocketHandle handle) { ::close(handle); }
inline bool ensureSocketsInitialized() { return true; }
#endif

}  // namespace net
}  // namespace mcdisc
