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

#ifndef LOCUS_SERVER_H
#define LOCUS_SERVER_H

#include <locus/dispatcher.h> // base class
#include <locus/nodeAddress.h> // return value

namespace locus
{
namespace detail
{
class Server;
class ConnectionThread;
class ReceiverThread;
}

/**
 * A request/reply server dispatching received commands.
 *
 * A receiver thread accepts incoming connections and starts one thread per
 * connection. Requests on one connection are served sequentially, each
 * request receives exactly one CMD_REPLY. An Exception thrown by a command
 * handler is sent back as an error reply, the server keeps running.
 */
class Server : public Dispatcher
{
public:
    /** @name State Changes */
    //@{
    /**
     * Open a listening connection and start the receiver thread.
     *
     * @param address the listening address, port 0 selects a free port.
     * @return true if the server is listening, false otherwise.
     * @version 1.0
     */
    LOCUS_API bool listen( const NodeAddress& address );

    /**
     * Stop the receiver thread and close all connections.
     *
     * Blocks until all connection threads have finished.
     * @version 1.0
     */
    LOCUS_API void close();

    /** @return true if the server is listening. @version 1.0 */
    LOCUS_API bool isListening() const;

    /** @return the address the server is listening on. @version 1.0 */
    LOCUS_API NodeAddress getListenAddress() const;
    //@}

    /** @internal Process one request and build the reply. */
    LOCUS_API void handleRequest( ICommand& command, OCommand& reply );

protected:
    LOCUS_API Server();
    LOCUS_API virtual ~Server();

private:
    detail::Server* const _impl;
    friend class detail::ConnectionThread;
    friend class detail::ReceiverThread;

    void _runReceiverThread();
    void _runConnection( ConnectionPtr connection );
    void _reapThreads( const bool all );
};
}
#endif // LOCUS_SERVER_H
