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

#ifndef LOCUS_CONNECTION_H
#define LOCUS_CONNECTION_H

#include <locus/api.h>
#include <locus/types.h>

#include <lunchbox/referenced.h>   // base class
#include <boost/noncopyable.hpp>   // base class

namespace locus
{
namespace detail { class Connection; }

/**
 * A TCP stream between a client and a kernel or directory server.
 *
 * A connection either listens on its address or is connected to exactly one
 * peer. Blocking calls give up after Global::getTimeout().
 */
class Connection : public lunchbox::Referenced, public boost::noncopyable
{
public:
    enum State
    {
        STATE_CLOSED,
        STATE_CONNECTING,
        STATE_CONNECTED,
        STATE_LISTENING,
        STATE_CLOSING
    };

    /** @return a new, closed connection to the address. @version 1.0 */
    LOCUS_API static ConnectionPtr create( const NodeAddress& address );

    LOCUS_API State getState() const;
    bool isClosed() const { return getState() == STATE_CLOSED; }
    bool isConnected() const { return getState() == STATE_CONNECTED; }
    bool isListening() const { return getState() == STATE_LISTENING; }

    /**
     * @return the address given at creation, with the port chosen by the
     *         system once listening on port 0.
     * @version 1.0
     */
    LOCUS_API const NodeAddress& getAddress() const;

    virtual bool connect() = 0;
    virtual bool listen() = 0;

    /** Close the connection and wake up threads blocked on it. */
    virtual void close() = 0;

    /** @return the next incoming connection, or 0 once closed. */
    virtual ConnectionPtr acceptSync() = 0;

    /**
     * Receive exactly the given number of bytes.
     *
     * @return false on errors, timeouts and if the peer closed the stream.
     * @version 1.0
     */
    LOCUS_API bool recvSync( void* buffer, const uint64_t bytes );

    /**
     * Send all bytes of the buffer.
     *
     * Sends from different threads are not interleaved.
     * @version 1.0
     */
    LOCUS_API bool send( const void* buffer, const uint64_t bytes );

protected:
    LOCUS_API explicit Connection( const NodeAddress& address );
    LOCUS_API virtual ~Connection();

    enum ReadStatus
    {
        READ_TIMEOUT = -2,
        READ_ERROR   = -1
    };

    /** @return the bytes read, 0 at the end of stream, or a ReadStatus. */
    virtual int64_t readSync( void* buffer, const uint64_t bytes ) = 0;

    /** @return the bytes written, or -1 on error. */
    virtual int64_t write( const void* buffer, const uint64_t bytes ) = 0;

    LOCUS_API void _setState( const State state );

    /** Update the port after binding to an ephemeral one. */
    LOCUS_API void _setAddress( const NodeAddress& address );

private:
    detail::Connection* const _impl;
};

LOCUS_API std::ostream& operator << ( std::ostream&, const Connection& );
}

#endif //LOCUS_CONNECTION_H
