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

#include "server.h"

#include "buffer.h"
#include "connection.h"
#include "exception.h"
#include "iCommand.h"
#include "log.h"
#include "oCommand.h"

#include <lunchbox/atomic.h>
#include <lunchbox/debug.h>
#include <lunchbox/lock.h>
#include <lunchbox/scopedMutex.h>
#include <lunchbox/thread.h>

#include <boost/lexical_cast.hpp>
#include <list>

namespace locus
{
namespace detail
{
class ReceiverThread : public lunchbox::Thread
{
public:
    explicit ReceiverThread( locus::Server* server ) : _server( server ) {}
    bool init() override
    {
        setName( "Rcv" );
        return true;
    }

    void run() override { _server->_runReceiverThread(); }

private:
    locus::Server* const _server;
};

class ConnectionThread : public lunchbox::Thread
{
public:
    ConnectionThread( locus::Server* server, ConnectionPtr connection_ )
        : connection( connection_ )
        , _server( server )
    {}

    bool init() override
    {
        static lunchbox::a_int32_t threadIDs;
        const int32_t threadID = ++threadIDs - 1;
        setName( std::string( "Con" ) +
                 boost::lexical_cast< std::string >( threadID ));
        return true;
    }

    void run() override { _server->_runConnection( connection ); }

    ConnectionPtr connection;

private:
    locus::Server* const _server;
};

typedef std::list< ConnectionThread* > ConnectionThreads;
typedef ConnectionThreads::iterator ConnectionThreadsIter;

class Server
{
public:
    explicit Server( locus::Server* server )
        : receiverThread( server )
    {}

    ~Server()
    {
        LBASSERT( !listener );
        LBASSERT( threads.empty( ));
    }

    ConnectionPtr listener;
    ReceiverThread receiverThread;

    lunchbox::Lock threadLock;
    ConnectionThreads threads; //!< one per accepted connection
};
}

Server::Server()
    : _impl( new detail::Server( this ))
{}

Server::~Server()
{
    close();
    delete _impl;
}

bool Server::listen( const NodeAddress& address )
{
    if( _impl->listener )
    {
        LBWARN << "Server is already listening on "
               << _impl->listener->getAddress() << std::endl;
        return false;
    }

    ConnectionPtr listener = Connection::create( address );
    if( !listener->listen( ))
        return false;

    _impl->listener = listener;
    if( !_impl->receiverThread.start( ))
    {
        LBERROR << "Could not start receiver thread" << std::endl;
        listener->close();
        _impl->listener = 0;
        return false;
    }

    LBLOG( LOG_RPC ) << lunchbox::className( this ) << " listening on "
                     << listener->getAddress() << std::endl;
    return true;
}

void Server::close()
{
    if( !_impl->listener )
        return;

    _impl->listener->close();
    _impl->receiverThread.join();
    _impl->listener = 0;

    _reapThreads( true );
    LBLOG( LOG_RPC ) << lunchbox::className( this ) << " closed" << std::endl;
}

bool Server::isListening() const
{
    return _impl->listener && _impl->listener->isListening();
}

NodeAddress Server::getListenAddress() const
{
    if( !_impl->listener )
        return NodeAddress();
    return _impl->listener->getAddress();
}

void Server::_runReceiverThread()
{
    ConnectionPtr listener = _impl->listener;
    LBASSERT( listener );

    while( listener->isListening( ))
    {
        ConnectionPtr connection = listener->acceptSync();
        if( !connection )
            continue;

        _reapThreads( false );

        detail::ConnectionThread* thread =
            new detail::ConnectionThread( this, connection );
        lunchbox::ScopedWrite mutex( _impl->threadLock );
        if( thread->start( ))
            _impl->threads.push_back( thread );
        else
        {
            LBERROR << "Could not start thread for " << *connection
                    << std::endl;
            connection->close();
            delete thread;
        }
    }
    LBVERB << "Leaving receiver thread of " << lunchbox::className( this )
           << std::endl;
}

void Server::_reapThreads( const bool all )
{
    lunchbox::ScopedWrite mutex( _impl->threadLock );
    for( detail::ConnectionThreadsIter i = _impl->threads.begin();
         i != _impl->threads.end(); )
    {
        detail::ConnectionThread* thread = *i;
        if( !all && !thread->isStopped( ))
        {
            ++i;
            continue;
        }

        thread->connection->close();
        thread->join();
        delete thread;
        i = _impl->threads.erase( i );
    }
}

void Server::_runConnection( ConnectionPtr connection )
{
    while( connection->isConnected( ))
    {
        BufferPtr buffer = ICommand::readBuffer( connection );
        if( !buffer )
            break;

        ICommand command( connection, buffer );
        OCommand reply( CMD_REPLY );
        handleRequest( command, reply );
        if( !reply.send( connection ))
        {
            LBLOG( LOG_RPC ) << "Could not send reply for " << command
                             << std::endl;
            break;
        }
    }
    connection->close();
}

void Server::handleRequest( ICommand& command, OCommand& reply )
{
    reply << uint32_t( REPLY_OK );
    try
    {
        if( !command.isValid( ))
            throw Exception( Exception::PROTOCOL, "Malformed command" );

        if( !dispatchCommand( command, reply ))
            throw Exception( Exception::PROTOCOL, "Unknown command " +
                  boost::lexical_cast< std::string >( command.getCommand( )));
    }
    catch( const Exception& e )
    {
        LBLOG( LOG_RPC ) << "Request " << command << " failed: " << e.what()
                         << std::endl;
        reply.reset();
        reply << uint32_t( REPLY_ERROR ) << e.getType() << e.getMessage();
    }
    catch( const std::exception& e )
    {
        LBWARN << "Request " << command << " failed: " << e.what()
               << std::endl;
        reply.reset();
        reply << uint32_t( REPLY_ERROR ) << uint32_t( Exception::CUSTOM )
              << std::string( e.what( ));
    }
    catch( ... )
    {
        LBWARN << "Request " << command << " failed with an unknown exception"
               << std::endl;
        reply.reset();
        reply << uint32_t( REPLY_ERROR ) << uint32_t( Exception::CUSTOM )
              << std::string( "Unknown exception" );
    }
}

}
