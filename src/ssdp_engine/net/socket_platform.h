/**
 * @file socket_platform.h
 * @brief Platform socket includes and the small macro layer used by the transport.
 */
#ifndef SSDPTRACK_NET_SOCKET_PLATFORM_H
#define SSDPTRACK_NET_SOCKET_PLATFORM_H

#ifdef _WIN32
    #include <winsock2.h>
    #include <ws2tcpip.h>
    #include <iphlpapi.h>
    #pragma comment(lib, "Ws2_32.lib")
    using socket_t = SOCKET;
    using ssdp_socklen_t = int;
    #define SSDP_INVALID_SOCKET_VALUE INVALID_SOCKET
    #define SSDP_GET_LAST_SOCK_ERROR WSAGetLastError()
    #define SSDP_CLOSE_SOCKET(sock) closesocket(sock)
#else
    #include <sys/types.h>
    #include <sys/socket.h>
    #include <netinet/in.h>
    #include <arpa/inet.h>
    #include <net/if.h>
    #include <unistd.h>
    #include <fcntl.h>
    #include <errno.h>
    using socket_t = int;
    using ssdp_socklen_t = socklen_t;
    #define SSDP_INVALID_SOCKET_VALUE -1
    #define SSDP_GET_LAST_SOCK_ERROR errno
    #define SSDP_CLOSE_SOCKET(sock) ::close(sock)
#endif

#endif // SSDPTRACK_NET_SOCKET_PLATFORM_H
