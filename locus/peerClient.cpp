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

#include "peerClient.h"

#include "directory.h"
#include "exception.h"
#include "global.h"
#include "log.h"
#include "nodeAddress.h"
#include "peer.h"
#include "remotePeer.h"

#include <lunchbox/debug.h>
#include <lunchbox/lockable.h>
#include <lunchbox/scopedMutex.h>
#include <lunchbox/sleep.h>
#include <lunchbox/spinLock.h>
#include <lunchbox/stdExt.h>

#include <algorithm>
#include <map>

namespace locus
{
namespace detail
{
typedef stde::hash_map< OID, NodeAddress > LocationHash;
typedef LocationHash::const_iterator LocationHashCIter;
typedef std::map< NodeAddress, PeerPtr > PeerMap;
typedef PeerMap::const_iterator PeerMapCIter;

class PeerClient
{
public:
    PeerClient( DirectoryPtr directory_,
                const locus::PeerClient::Connector& connector_,
                Peer* local_ )
        : directory( directory_ )
        , connector( connector_ )
        , local( local_ )
    {
        if( !connector )
            connector = &RemotePeer::create;
    }

    static uint32_t getAttempts( const Global::IAttribute attr )
    {
        return std::max( Global::getIAttribute( attr ), 1 );
    }

    DirectoryPtr directory;
    locus::PeerClient::Connector connector;
    Peer* const local; //!< not cached, owns this client

    lunchbox::Lockable< LocationHash, lunchbox::SpinLock > locations;
    lunchbox::Lockable< PeerMap, lunchbox::SpinLock > peers;
};
}

PeerClient::PeerClient( DirectoryPtr directory, const Connector& connector,
                        Peer* local )
    : _impl( new detail::PeerClient( directory, connector, local ))
{
    LBASSERT( directory );
}

PeerClient::~PeerClient()
{
    clear();
    delete _impl;
}

DirectoryPtr PeerClient::getDirectory() const
{
    return _impl->directory;
}

std::string PeerClient::invoke( const OID& oid, const std::string& method,
                                const Strings& args )
{
    const uint32_t attempts =
        detail::PeerClient::getAttempts( Global::IATTR_INVOKE_RETRIES );
    const int32_t backoff = Global::getIAttribute( Global::IATTR_INVOKE_BACKOFF );

    for( uint32_t i = 0; i < attempts; ++i )
    {
        const NodeAddress node = resolve( oid );
        InvokeReply reply;
        try
        {
            reply = getPeer( node )->invoke( oid, method, args );
        }
        catch( const Exception& e )
        {
            if( e.getType() != Exception::UNREACHABLE )
            {
                releasePeer( node );
                throw;
            }
            LBLOG( LOG_RPC ) << "Host " << node << " of " << oid
                             << " unreachable, re-resolving" << std::endl;
            invalidate( oid );
            releasePeer( node );
            continue;
        }

        switch( reply.status )
        {
          case InvokeReply::STATUS_OK:
              return reply.value;

          case InvokeReply::STATUS_NOT_HERE:
              LBLOG( LOG_RPC ) << oid << " not on " << node
                               << ", re-resolving" << std::endl;
              invalidate( oid );
              break;

          case InvokeReply::STATUS_INVALID_STATE:
              LBLOG( LOG_RPC ) << oid << " on " << node
                               << " not active, retrying" << std::endl;
              invalidate( oid );
              if( backoff > 0 )
                  lunchbox::sleep( backoff );
              break;

          case InvokeReply::STATUS_REMOTE_ERROR:
              throw Exception( Exception::REMOTE_INVOCATION, reply.value );

          default:
              throw Exception( Exception::PROTOCOL, "Unknown invoke status" );
        }
    }

    std::ostringstream os;
    os << oid << " not reachable after " << attempts << " attempts";
    throw Exception( Exception::NOT_FOUND, os.str( ));
}

void PeerClient::transferObject( const NodeAddress& destination,
                                 const OID& oid, const Snapshot& snapshot )
{
    const int32_t retries = Global::getIAttribute(
                                Global::IATTR_TRANSFER_RETRIES );
    for( int32_t i = 0; ; ++i )
    {
        try
        {
            getPeer( destination )->receiveMigratedObject( oid, snapshot );
            LBLOG( LOG_MIGRATION ) << "Transferred " << oid << " to "
                                   << destination << std::endl;
            return;
        }
        catch( const Exception& e )
        {
            releasePeer( destination );
            if( e.getType() != Exception::UNREACHABLE || i >= retries )
                throw;

            LBLOG( LOG_MIGRATION ) << "Transfer of " << oid << " to "
                                   << destination << " failed: " << e.what()
                                   << ", retrying" << std::endl;
            lunchbox::sleep( Global::getIAttribute(
                                 Global::IATTR_TRANSFER_RETRY_DELAY ));
        }
    }
}

OID PeerClient::createObject( const NodeAddress& node, const std::string& type,
                              const Strings& args )
{
    const OID oid = getPeer( node )->createObject( type, args );
    setLocation( oid, node );
    return oid;
}

void PeerClient::moveObject( const OID& oid, const NodeAddress& destination )
{
    const uint32_t attempts =
        detail::PeerClient::getAttempts( Global::IATTR_INVOKE_RETRIES );

    for( uint32_t i = 0; ; ++i )
    {
        const NodeAddress node = resolve( oid );
        try
        {
            getPeer( node )->moveObject( oid, destination );
            setLocation( oid, destination );
            return;
        }
        catch( const Exception& e )
        {
            const bool moved = e.getType() == Exception::NOT_FOUND ||
                               e.getType() == Exception::UNREACHABLE;
            invalidate( oid );
            if( e.getType() == Exception::UNREACHABLE )
                releasePeer( node );
            if( !moved || i + 1 >= attempts )
                throw;
        }
    }
}

NodeAddress PeerClient::resolve( const OID& oid )
{
    {
        lunchbox::ScopedFastRead mutex( _impl->locations );
        detail::LocationHashCIter i = _impl->locations->find( oid );
        if( i != _impl->locations->end( ))
            return i->second;
    }

    const NodeAddress node = _impl->directory->resolve( oid );
    setLocation( oid, node );
    return node;
}

void PeerClient::invalidate( const OID& oid )
{
    lunchbox::ScopedFastWrite mutex( _impl->locations );
    _impl->locations->erase( oid );
}

void PeerClient::setLocation( const OID& oid, const NodeAddress& node )
{
    lunchbox::ScopedFastWrite mutex( _impl->locations );
    (*_impl->locations)[ oid ] = node;
}

PeerPtr PeerClient::getPeer( const NodeAddress& node )
{
    if( _impl->local && _impl->local->getAddress() == node )
        return _impl->local;
    {
        lunchbox::ScopedFastRead mutex( _impl->peers );
        detail::PeerMapCIter i = _impl->peers->find( node );
        if( i != _impl->peers->end( ))
            return i->second;
    }

    PeerPtr peer = _impl->connector( node );
    if( !peer )
        throw Exception( Exception::UNREACHABLE, node.toString( ));

    lunchbox::ScopedFastWrite mutex( _impl->peers );
    // another thread may have connected in the meantime
    std::pair< detail::PeerMap::iterator, bool > result =
        _impl->peers->insert( std::make_pair( node, peer ));
    return result.first->second;
}

void PeerClient::releasePeer( const NodeAddress& node )
{
    PeerPtr peer;
    lunchbox::ScopedFastWrite mutex( _impl->peers );
    detail::PeerMap::iterator i = _impl->peers->find( node );
    if( i == _impl->peers->end( ))
        return;
    peer = i->second;
    _impl->peers->erase( i );
}

void PeerClient::clear()
{
    detail::PeerMap peers;
    {
        lunchbox::ScopedFastWrite mutex( _impl->peers );
        _impl->peers->swap( peers );
    }
    lunchbox::ScopedFastWrite mutex( _impl->locations );
    _impl->locations->clear();
}

}
