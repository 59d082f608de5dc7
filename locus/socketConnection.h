/* Copyright (c) 2026, The Locus Authors
 *
 * This file is part of Locus
 *
 * This library is free software; you can redistribute it and/or modify it under
 * the terms of the GNU Lesser General Public License version 2.1 as published
 * by the Free Software Foundation.
 *
 * This library is distributed in the hope that it will be useful, but WITHOUT
 * ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or FITNESS
 * FOR A PARTICULAR PURPOSE.  See the GNU Lesser General Public License for more
 * details.
 *
 * You should have received a copy of the GNU Lesser General Public License
 * along with this library; if not, write to the Free Software Foundation, Inc.,
 * 51 Franklin Street, Fifth Floor, Boston, MA 02110-1301 USA.
 */

#ifndef LOCUS_SOCKETCONNECTION_H
#define LOCUS_SOCKETCONNECTION_H

#include <locus/connection.h> // base class

#include <lunchbox/lock.h> // member

namespace locus
{
/**
 * A TCP/IP stream connection using BSD sockets.
 *
 * Send and receive calls honor the socket timeouts configured from
 * Global::getTimeout(). A port of 0 when listening selects an ephemeral
 * port, which is reflected in getAddress() afterwards.
 */
class SocketConnection : public Connection
{
public:
    /** Create a new, closed connection for the given address. */
    LOCUS_API explicit SocketConnection( const NodeAddress& address );

    LOCUS_API bool connect() override;
    LOCUS_API bool listen() override;
    LOCUS_API void close() override;
    LOCUS_API ConnectionPtr acceptSync() override;

protected:
    virtual ~SocketConnection();

    int64_t readSync( void* buffer, const uint64_t bytes ) override;
    int64_t write( const void* buffer, const uint64_t bytes ) override;

private:
    int _fd;
    lunchbox::Lock _closeLock;

    SocketConnection( const NodeAddress& address, const int fd );

    bool _createSocket( const struct addrinfo& info );
    void _tuneSocket();
};
}

#endif //LOCUS_SOCKETCONNECTION_H
