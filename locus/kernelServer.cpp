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

#include "kernelServer.h"

#include "directory.h"
#include "exception.h"
#include "global.h"
#include "hostedObject.h"
#include "iCommand.h"
#include "log.h"
#include "nodeAddress.h"
#include "oCommand.h"
#include "objectRegistry.h"

#include <lunchbox/debug.h>
#include <lunchbox/lockable.h>
#include <lunchbox/scopedMutex.h>
#include <lunchbox/sleep.h>
#include <lunchbox/spinLock.h>
#include <lunchbox/stdExt.h>

#include <boost/bind.hpp>
#include <algorithm>

namespace locus
{
namespace detail
{
/** An ongoing or incomplete migration of one object. */
struct Migration
{
    enum Phase
    {
        PHASE_NEW,      //!< nothing sent to the destination yet
        PHASE_TRANSFER, //!< transfer sent, installation not confirmed
        PHASE_UPDATE    //!< installed, waiting for the directory update
    };

    Migration() : phase( PHASE_NEW ), running( false ) {}
    explicit Migration( const NodeAddress& destination_ )
        : destination( destination_ ), phase( PHASE_NEW ), running( true ) {}

    NodeAddress destination;
    Phase phase;
    bool running; //!< false: suspended in phase
};

typedef stde::hash_map< OID, Migration > MigrationHash;
typedef MigrationHash::const_iterator MigrationHashCIter;

class KernelServer
{
public:
    KernelServer( locus::KernelServer* server, const NodeAddress& host_,
                  DirectoryPtr directory_, ObjectFactory& factory,
                  const locus::PeerClient::Connector& connector )
        : host( host_ )
        , directory( directory_ )
        , registry( host_, directory_, factory )
        , peerClient( directory_, connector, server )
    {}

    /**
     * Claim the migration record of an object.
     * @return the phase in which a suspended migration is resumed.
     */
    Migration::Phase startMigration( const OID& oid,
                                     const NodeAddress& destination )
    {
        lunchbox::ScopedFastWrite mutex( migrations );
        MigrationHash::iterator i = migrations->find( oid );
        if( i == migrations->end( ))
        {
            (*migrations)[ oid ] = Migration( destination );
            return Migration::PHASE_NEW;
        }

        Migration& migration = i->second;
        if( migration.running )
            throw Exception( Exception::INVALID_STATE,
                             oid.getString() + " is already being moved" );
        if( migration.destination != destination )
            throw Exception( Exception::INVALID_STATE,
                             oid.getString() + " has a pending migration to " +
                             migration.destination.toString( ));
        migration.running = true;
        return migration.phase;
    }

    void finishMigration( const OID& oid )
    {
        lunchbox::ScopedFastWrite mutex( migrations );
        migrations->erase( oid );
    }

    void suspendMigration( const OID& oid, const Migration::Phase phase )
    {
        lunchbox::ScopedFastWrite mutex( migrations );
        MigrationHash::iterator i = migrations->find( oid );
        LBASSERT( i != migrations->end( ));
        if( i == migrations->end( ))
            return;
        i->second.phase = phase;
        i->second.running = false;
    }

    const NodeAddress host;
    DirectoryPtr directory;
    ObjectRegistry registry;
    locus::PeerClient peerClient;

    lunchbox::Lockable< MigrationHash, lunchbox::SpinLock > migrations;
};
}

KernelServer::KernelServer( const NodeAddress& host, DirectoryPtr directory,
                            ObjectFactory& factory,
                            const PeerClient::Connector& connector )
    : _impl( new detail::KernelServer( this, host, directory, factory,
                                       connector ))
{
    registerCommand( CMD_KERNEL_INVOKE,
                     boost::bind( &KernelServer::_cmdInvoke, this, _1, _2 ));
    registerCommand( CMD_KERNEL_RECEIVE_OBJECT,
                     boost::bind( &KernelServer::_cmdReceiveObject, this,
                                  _1, _2 ));
    registerCommand( CMD_KERNEL_CREATE_OBJECT,
                     boost::bind( &KernelServer::_cmdCreateObject, this,
                                  _1, _2 ));
    registerCommand( CMD_KERNEL_MOVE_OBJECT,
                     boost::bind( &KernelServer::_cmdMoveObject, this,
                                  _1, _2 ));
}

KernelServer::~KernelServer()
{
    close();
    delete _impl;
}

NodeAddress KernelServer::getAddress() const
{
    return _impl->host;
}

ObjectRegistry& KernelServer::getRegistry()
{
    return _impl->registry;
}

PeerClient& KernelServer::getPeerClient()
{
    return _impl->peerClient;
}

DirectoryPtr KernelServer::getDirectory() const
{
    return _impl->directory;
}

bool KernelServer::listen()
{
    if( !_impl->host.isValid( ))
    {
        LBWARN << "Kernel server needs a host name and a fixed port, got "
               << _impl->host << std::endl;
        return false;
    }
    if( !Server::listen( _impl->host ))
    {
        LBWARN << "Kernel server can't listen on " << _impl->host
               << std::endl;
        return false;
    }
    LBINFO << "Kernel server listening on " << _impl->host << std::endl;
    return true;
}

void KernelServer::close()
{
    Server::close();
    _impl->peerClient.clear();
}

void KernelServer::registerWithDirectory( const std::string& region )
{
    _impl->directory->registerNode( _impl->host, region );
}

//----------------------------------------------------------------------
// Peer interface
//----------------------------------------------------------------------
InvokeReply KernelServer::invoke( const OID& oid, const std::string& method,
                                  const Strings& args )
{
    HostedObjectPtr hosted = _impl->registry.find( oid );
    if( !hosted )
        return InvokeReply( InvokeReply::STATUS_NOT_HERE, std::string( ));

    try
    {
        return InvokeReply( InvokeReply::STATUS_OK,
                            hosted->invoke( method, args ));
    }
    catch( const Exception& e )
    {
        if( e.getType() == Exception::INVALID_STATE )
            return InvokeReply( InvokeReply::STATUS_INVALID_STATE,
                                e.getMessage( ));

        LBLOG( LOG_OBJECTS ) << "Invocation of " << method << " on " << oid
                             << " failed: " << e.what() << std::endl;
        return InvokeReply( InvokeReply::STATUS_REMOTE_ERROR,
                            e.getMessage( ));
    }
}

void KernelServer::receiveMigratedObject( const OID& oid,
                                          const Snapshot& snapshot )
{
    _impl->registry.insert( oid, snapshot );
    LBLOG( LOG_MIGRATION ) << "Received " << oid << " on " << _impl->host
                           << std::endl;
}

OID KernelServer::createObject( const std::string& type, const Strings& args )
{
    return _impl->registry.create( type, args );
}

void KernelServer::moveObject( const OID& oid, const NodeAddress& destination )
{
    if( destination == _impl->host )
    {
        _impl->registry.lookup( oid );
        LBLOG( LOG_MIGRATION ) << "Ignoring move of " << oid << " to itself"
                               << std::endl;
        return;
    }

    const detail::Migration::Phase phase =
        _impl->startMigration( oid, destination );
    HostedObjectPtr hosted = _impl->registry.find( oid );
    if( !hosted )
    {
        // moved away by a migration which completed before the claim
        _impl->finishMigration( oid );
        throw Exception( Exception::NOT_FOUND, oid.getString( ));
    }

    switch( phase )
    {
      case detail::Migration::PHASE_NEW:
          _transferObject( *hosted, destination, false );
          break;

      case detail::Migration::PHASE_TRANSFER:
          LBINFO << "Retrying transfer of " << oid << " to " << destination
                 << std::endl;
          _transferObject( *hosted, destination, true );
          break;

      case detail::Migration::PHASE_UPDATE:
          LBINFO << "Resuming migration of " << oid << " to " << destination
                 << std::endl;
          break;
    }

    _updateDirectory( oid, destination );

    _impl->registry.remove( oid );
    _impl->peerClient.setLocation( oid, destination );
    _impl->finishMigration( oid );
    LBLOG( LOG_MIGRATION ) << "Moved " << oid << " from " << _impl->host
                           << " to " << destination << std::endl;
}

void KernelServer::_transferObject( HostedObject& hosted,
                                    const NodeAddress& destination,
                                    const bool retry )
{
    const OID& oid = hosted.getOID();
    Snapshot snapshot;
    try
    {
        snapshot = hosted.freeze();
    }
    catch( const Exception& )
    {
        if( retry )
            _impl->suspendMigration( oid, detail::Migration::PHASE_TRANSFER );
        else
            _impl->finishMigration( oid );
        throw;
    }

    try
    {
        _impl->peerClient.transferObject( destination, oid, snapshot );
        return;
    }
    catch( const Exception& e )
    {
        if( e.getType() == Exception::DUPLICATE )
        {
            if( retry )
            {
                // installed by the earlier attempt, whose reply got lost
                LBWARN << oid << " already resident on " << destination
                       << ", completing migration" << std::endl;
                return;
            }
            _impl->finishMigration( oid );
            LBERROR << "Migration of " << oid << " to " << destination
                    << " failed, object exists at destination" << std::endl;
            throw;
        }

        // a rejected snapshot or a destination never contacted by any
        // attempt did not install the object
        const bool installed =
            e.getType() != Exception::DESERIALIZATION &&
            ( retry || e.getType() != Exception::UNREACHABLE );
        if( installed )
        {
            _impl->suspendMigration( oid, detail::Migration::PHASE_TRANSFER );
            LBWARN << "Transfer of " << oid << " to " << destination
                   << " unconfirmed, migration pending: " << e.what()
                   << std::endl;
        }
        else
        {
            _impl->finishMigration( oid );
            LBWARN << "Transfer of " << oid << " to " << destination
                   << " failed, object stays frozen: " << e.what()
                   << std::endl;
        }
        throw Exception( Exception::TRANSFER, e.what( ));
    }
}

void KernelServer::_updateDirectory( const OID& oid,
                                     const NodeAddress& destination )
{
    const int32_t attempts = std::max( Global::getIAttribute(
                                    Global::IATTR_DIRECTORY_RETRIES ), 1 );
    const int32_t delay = Global::getIAttribute(
                              Global::IATTR_DIRECTORY_RETRY_DELAY );

    for( int32_t i = 0; i < attempts; ++i )
    {
        if( i > 0 && delay > 0 )
            lunchbox::sleep( delay );
        try
        {
            _impl->directory->updateLocation( oid, destination );
            return;
        }
        catch( const Exception& e )
        {
            if( e.getType() != Exception::DIRECTORY_UNAVAILABLE )
            {
                _impl->suspendMigration( oid,
                                         detail::Migration::PHASE_UPDATE );
                throw;
            }
            LBLOG( LOG_MIGRATION ) << "Directory update of " << oid
                                   << " failed: " << e.what() << std::endl;
        }
    }

    _impl->suspendMigration( oid, detail::Migration::PHASE_UPDATE );
    LBWARN << "Directory update of " << oid << " to " << destination
           << " failed " << attempts << " times, migration pending"
           << std::endl;
    throw Exception( Exception::DIRECTORY_UNAVAILABLE,
                     "Location update of " + oid.getString() + " pending" );
}

void KernelServer::reactivateObject( const OID& oid )
{
    // blocks concurrent and pending migrations while thawing
    _impl->startMigration( oid, _impl->host );
    HostedObjectPtr hosted = _impl->registry.find( oid );
    if( !hosted )
    {
        _impl->finishMigration( oid );
        throw Exception( Exception::NOT_FOUND, oid.getString( ));
    }

    try
    {
        hosted->thaw();
    }
    catch( const Exception& )
    {
        _impl->finishMigration( oid );
        throw;
    }
    _impl->finishMigration( oid );
    LBINFO << "Reactivated " << oid << std::endl;
}

OIDs KernelServer::getPendingMigrations() const
{
    OIDs oids;
    lunchbox::ScopedFastRead mutex( _impl->migrations );
    for( detail::MigrationHashCIter i = _impl->migrations->begin();
         i != _impl->migrations->end(); ++i )
    {
        if( !i->second.running )
            oids.push_back( i->first );
    }
    return oids;
}

//----------------------------------------------------------------------
// Command handlers
//----------------------------------------------------------------------
void KernelServer::_cmdInvoke( ICommand& command, OCommand& reply )
{
    const OID oid = command.read< OID >();
    const std::string method = command.read< std::string >();
    const Strings args = command.read< Strings >();

    const InvokeReply result = invoke( oid, method, args );
    reply << result.status << result.value;
}

void KernelServer::_cmdReceiveObject( ICommand& command, OCommand& )
{
    const OID oid = command.read< OID >();
    const Snapshot snapshot = command.read< Snapshot >();
    receiveMigratedObject( oid, snapshot );
}

void KernelServer::_cmdCreateObject( ICommand& command, OCommand& reply )
{
    const std::string type = command.read< std::string >();
    const Strings args = command.read< Strings >();
    reply << createObject( type, args );
}

void KernelServer::_cmdMoveObject( ICommand& command, OCommand& )
{
    const OID oid = command.read< OID >();
    const NodeAddress destination = command.read< NodeAddress >();
    moveObject( oid, destination );
}

}
