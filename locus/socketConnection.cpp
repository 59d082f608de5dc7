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

#include "socketConnection.h"

#include "global.h"
#include "log.h"
#include "nodeAddress.h"

#include <lunchbox/debug.h>
#include <lunchbox/scopedMutex.h>

#include <boost/lexical_cast.hpp>

#include <arpa/inet.h>
#include <errno.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <string.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

namespace locus
{
namespace
{
timeval _toTimeval( const uint32_t timeout )
{
    timeval tv;
    if( timeout == LB_TIMEOUT_INDEFINITE )
    {
        tv.tv_sec = 0;
        tv.tv_usec = 0;
    }
    else
    {
        tv.tv_sec = timeout / 1000;
        tv.tv_usec = ( timeout % 1000 ) * 1000;
    }
    return tv;
}
}

SocketConnection::SocketConnection( const NodeAddress& address )
        : Connection( address )
        , _fd( -1 )
{
    LBVERB << "New SocketConnection @" << (void*)this << std::endl;
}

SocketConnection::SocketConnection( const NodeAddress& address, const int fd )
        : Connection( address )
        , _fd( fd )
{
    _tuneSocket();
    _setState( STATE_CONNECTED );
}

SocketConnection::~SocketConnection()
{
    close();
}

bool SocketConnection::_createSocket( const addrinfo& info )
{
    _fd = ::socket( info.ai_family, info.ai_socktype, info.ai_protocol );
    if( _fd < 0 )
    {
        LBWARN << "Could not create socket: " << lunchbox::sysError
               << std::endl;
        return false;
    }
    return true;
}

void SocketConnection::_tuneSocket()
{
    const int on = 1;
    ::setsockopt( _fd, IPPROTO_TCP, TCP_NODELAY, &on, sizeof( on ));

    const timeval tv = _toTimeval( Global::getTimeout( ));
    ::setsockopt( _fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof( tv ));
}

bool SocketConnection::connect()
{
    if( !isClosed( ))
        return false;

    const NodeAddress& address = getAddress();
    if( !address.isValid( ))
    {
        LBWARN << "Invalid address " << address << " for connect"
               << std::endl;
        return false;
    }

    _setState( STATE_CONNECTING );

    addrinfo hints;
    ::memset( &hints, 0, sizeof( hints ));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    addrinfo* result = 0;
    const std::string port = boost::lexical_cast< std::string >( address.port );
    const int error = ::getaddrinfo( address.hostname.c_str(), port.c_str(),
                                     &hints, &result );
    if( error != 0 )
    {
        LBLOG( LOG_RPC ) << "Can't resolve " << address << ": "
                         << ::gai_strerror( error ) << std::endl;
        _setState( STATE_CLOSED );
        return false;
    }

    bool connected = false;
    for( addrinfo* info = result; info && !connected; info = info->ai_next )
    {
        if( !_createSocket( *info ))
            continue;

        if( ::connect( _fd, info->ai_addr, info->ai_addrlen ) == 0 )
            connected = true;
        else
        {
            ::close( _fd );
            _fd = -1;
        }
    }
    ::freeaddrinfo( result );

    if( !connected )
    {
        LBLOG( LOG_RPC ) << "Could not connect to " << address << ": "
                         << lunchbox::sysError << std::endl;
        _setState( STATE_CLOSED );
        return false;
    }

    _tuneSocket();
    const timeval tv = _toTimeval( Global::getTimeout( ));
    ::setsockopt( _fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof( tv ));

    _setState( STATE_CONNECTED );
    LBLOG( LOG_RPC ) << "Connected " << *this << std::endl;
    return true;
}

bool SocketConnection::listen()
{
    if( !isClosed( ))
        return false;

    _setState( STATE_CONNECTING );

    NodeAddress address = getAddress();
    addrinfo hints;
    ::memset( &hints, 0, sizeof( hints ));
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_flags = AI_PASSIVE;

    addrinfo* result = 0;
    const std::string port = boost::lexical_cast< std::string >( address.port );
    const char* host = address.hostname.empty() ? 0 : address.hostname.c_str();
    const int error = ::getaddrinfo( host, port.c_str(), &hints, &result );
    if( error != 0 )
    {
        LBWARN << "Can't resolve listening address " << address << ": "
               << ::gai_strerror( error ) << std::endl;
        _setState( STATE_CLOSED );
        return false;
    }

    bool bound = false;
    for( addrinfo* info = result; info && !bound; info = info->ai_next )
    {
        if( !_createSocket( *info ))
            continue;

        const int on = 1;
        ::setsockopt( _fd, SOL_SOCKET, SO_REUSEADDR, &on, sizeof( on ));

        if( ::bind( _fd, info->ai_addr, info->ai_addrlen ) == 0 )
            bound = true;
        else
        {
            ::close( _fd );
            _fd = -1;
        }
    }
    ::freeaddrinfo( result );

    if( !bound )
    {
        LBWARN << "Could not bind socket to " << address << ": "
               << lunchbox::sysError << std::endl;
        _setState( STATE_CLOSED );
        return false;
    }

    if( ::listen( _fd, SOMAXCONN ) != 0 )
    {
        LBWARN << "Could not listen on socket: " << lunchbox::sysError
               << std::endl;
        ::close( _fd );
        _fd = -1;
        _setState( STATE_CLOSED );
        return false;
    }

    if( address.port == 0 ) // ephemeral port, query the bound one
    {
        sockaddr_in bound_;
        socklen_t size = sizeof( bound_ );
        if( ::getsockname( _fd, reinterpret_cast< sockaddr* >( &bound_ ),
                           &size ) == 0 )
        {
            address.port = ntohs( bound_.sin_port );
            _setAddress( address );
        }
    }

    _setState( STATE_LISTENING );
    LBLOG( LOG_RPC ) << "Listening on " << *this << std::endl;
    return true;
}

void SocketConnection::close()
{
    lunchbox::ScopedWrite mutex( _closeLock );
    if( isClosed( ))
        return;

    _setState( STATE_CLOSING );
    if( _fd >= 0 )
    {
        // unblocks threads in accept() and recv()
        ::shutdown( _fd, SHUT_RDWR );
        if( ::close( _fd ) != 0 )
            LBWARN << "Could not close socket: " << lunchbox::sysError
                   << std::endl;
        _fd = -1;
    }
    _setState( STATE_CLOSED );
}

ConnectionPtr SocketConnection::acceptSync()
{
    if( !isListening( ))
        return 0;

    sockaddr_storage remote;
    socklen_t size = sizeof( remote );
    int fd = -1;
    while( true )
    {
        fd = ::accept( _fd, reinterpret_cast< sockaddr* >( &remote ), &size );
        if( fd >= 0 )
            break;
        if( errno == EINTR && isListening( ))
            continue;

        if( isListening( ))
            LBWARN << "Accept failed: " << lunchbox::sysError << std::endl;
        return 0;
    }

    char host[ NI_MAXHOST ];
    char port[ NI_MAXSERV ];
    NodeAddress address;
    if( ::getnameinfo( reinterpret_cast< sockaddr* >( &remote ), size,
                       host, sizeof( host ), port, sizeof( port ),
                       NI_NUMERICHOST | NI_NUMERICSERV ) == 0 )
    {
        address.hostname = host;
        address.port = boost::lexical_cast< uint16_t >( port );
    }

    ConnectionPtr connection = new SocketConnection( address, fd );
    LBLOG( LOG_RPC ) << "Accepted " << *connection << std::endl;
    return connection;
}

int64_t SocketConnection::readSync( void* buffer, const uint64_t bytes )
{
    while( true )
    {
        const ssize_t got = ::recv( _fd, buffer, bytes, MSG_NOSIGNAL );
        if( got >= 0 )
            return got;

        switch( errno )
        {
          case EINTR:
              if( isConnected( ))
                  continue;
              return READ_ERROR;

          case EAGAIN:
#if EAGAIN != EWOULDBLOCK
          case EWOULDBLOCK:
#endif
              return READ_TIMEOUT;

          default:
              if( isConnected( ))
                  LBLOG( LOG_RPC ) << "Error during read: "
                                   << lunchbox::sysError << std::endl;
              return READ_ERROR;
        }
    }
}

int64_t SocketConnection::write( const void* buffer, const uint64_t bytes )
{
    while( true )
    {
        const ssize_t wrote = ::send( _fd, buffer, bytes, MSG_NOSIGNAL );
        if( wrote >= 0 )
            return wrote;

        if( errno == EINTR && isConnected( ))
            continue;

        LBLOG( LOG_RPC ) << "Error during write: " << lunchbox::sysError
                         << std::endl;
        return -1;
    }
}

}
