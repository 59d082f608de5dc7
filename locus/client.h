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

#ifndef LOCUS_CLIENT_H
#define LOCUS_CLIENT_H

#include <locus/api.h>
#include <locus/types.h>

#include <boost/noncopyable.hpp>

namespace locus
{
namespace detail { class Client; }

/**
 * The requesting side of a Server.
 *
 * Holds one persistent connection to the server, established on first use
 * and re-established after a failure. Concurrent calls are serialized.
 */
class Client : public boost::noncopyable
{
public:
    /** Construct a new client for the server at the given address. */
    LOCUS_API explicit Client( const NodeAddress& address );

    LOCUS_API virtual ~Client();

    /** @return the address of the server. @version 1.0 */
    LOCUS_API const NodeAddress& getAddress() const;

    /**
     * Send a request and wait for its reply.
     *
     * @return the buffer holding the CMD_REPLY.
     * @throw Exception UNREACHABLE if no connection could be established.
     * @throw Exception CONNECTION_LOST if the connection failed before the
     *                  reply was received.
     * @version 1.0
     */
    LOCUS_API BufferPtr call( OCommand& request );

    /** Close the connection to the server. @version 1.0 */
    LOCUS_API void disconnect();

    /**
     * Check the status of a received reply.
     *
     * Consumes the status. On success, the reply is positioned at the
     * payload.
     *
     * @throw Exception the error reported by the server, or PROTOCOL for a
     *                  malformed reply.
     * @version 1.0
     */
    LOCUS_API static void checkReply( ICommand& reply );

private:
    detail::Client* const _impl;
};
}
#endif // LOCUS_CLIENT_H
