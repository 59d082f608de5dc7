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

#include "connection.h"

#include "log.h"
#include "nodeAddress.h"
#include "socketConnection.h"

#include <lunchbox/atomic.h>
#include <lunchbox/debug.h>
#include <lunchbox/lock.h>
#include <lunchbox/scopedMutex.h>

#define STATISTICS
namespace locus
{
namespace detail
{
class Connection
{
public:
    explicit Connection( const NodeAddress& address_ )
            : state( locus::Connection::STATE_CLOSED )
            , address( address_ )
            , outBytes( 0 )
            , inBytes( 0 )
    {}

    ~Connection()
    {
        LBASSERT( int32_t( state ) == locus::Connection::STATE_CLOSED );
    }

    lunchbox::a_int32_t state; //!< The connection state
    NodeAddress address; //!< The connection parameters

    /** The lock used to protect concurrent write calls. */
    mutable lunchbox::Lock sendLock;

    lunchbox::a_uint64_t outBytes; //!< Statistic: written bytes
    lunchbox::a_uint64_t inBytes; //!< Statistic: read bytes
};
}

Connection::Connection( const NodeAddress& address )
        : _impl( new detail::Connection( address ))
{
    LBVERB << "New Connection @" << (void*)this << std::endl;
}

Connection::~Connection()
{
    LBVERB << "Delete Connection @" << (void*)this << std::endl;
#ifdef STATISTICS
    if( _impl->outBytes > 0 || _impl->inBytes > 0 )
        LBLOG( LOG_RPC ) << *this << ": " << uint64_t( _impl->outBytes )
                         << " bytes out, " << uint64_t( _impl->inBytes )
                         << " bytes in" << std::endl;
#endif
    delete _impl;
}

ConnectionPtr Connection::create( const NodeAddress& address )
{
    return new SocketConnection( address );
}

Connection::State Connection::getState() const
{
    return State( int32_t( _impl->state ));
}

void Connection::_setState( const State state )
{
    _impl->state = state;
}

const NodeAddress& Connection::getAddress() const
{
    return _impl->address;
}

void Connection::_setAddress( const NodeAddress& address )
{
    _impl->address = address;
}

bool Connection::recvSync( void* buffer, const uint64_t bytes )
{
    uint8_t* ptr = static_cast< uint8_t* >( buffer );
    uint64_t bytesLeft = bytes;

    while( bytesLeft )
    {
        if( !isConnected( ))
            return false;

        const int64_t got = readSync( ptr, bytesLeft );
        if( got == READ_TIMEOUT )
        {
            LBLOG( LOG_RPC ) << "Read timeout on " << *this << std::endl;
            return false;
        }
        if( got <= 0 ) // error or closed by peer
            return false;

        bytesLeft -= got;
        ptr += got;
        _impl->inBytes += got;
    }
    return true;
}

bool Connection::send( const void* buffer, const uint64_t bytes )
{
    if( bytes == 0 )
        return true;

    const uint8_t* ptr = static_cast< const uint8_t* >( buffer );
    lunchbox::ScopedWrite mutex( _impl->sendLock );

    uint64_t bytesLeft = bytes;
    while( bytesLeft )
    {
        if( !isConnected( ))
            return false;

        const int64_t wrote = write( ptr, bytesLeft );
        if( wrote < 0 ) // error
        {
            LBLOG( LOG_RPC ) << "Error during write on " << *this << std::endl;
            return false;
        }

        bytesLeft -= wrote;
        ptr += wrote;
    }
    _impl->outBytes += bytes;
    return true;
}

std::ostream& operator << ( std::ostream& os, const Connection& connection )
{
    const Connection::State state = connection.getState();
    os << "Connection @" << (void*)&connection << " "
       << connection.getAddress() << " "
       << ( state == Connection::STATE_CLOSED     ? "closed" :
            state == Connection::STATE_CONNECTING ? "connecting" :
            state == Connection::STATE_CONNECTED  ? "connected" :
            state == Connection::STATE_LISTENING  ? "listening" :
            state == Connection::STATE_CLOSING    ? "closing" :
            "UNKNOWN" );
    return os;
}
}
