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

#include "remotePeer.h"

#include "buffer.h"
#include "client.h"
#include "iCommand.h"
#include "log.h"
#include "oCommand.h"

namespace locus
{
namespace detail
{
class RemotePeer
{
public:
    explicit RemotePeer( const NodeAddress& address ) : client( address ) {}

    locus::Client client;
};
}

RemotePeer::RemotePeer( const NodeAddress& address )
    : _impl( new detail::RemotePeer( address ))
{}

RemotePeer::~RemotePeer()
{
    delete _impl;
}

PeerPtr RemotePeer::create( const NodeAddress& address )
{
    return new RemotePeer( address );
}

NodeAddress RemotePeer::getAddress() const
{
    return _impl->client.getAddress();
}

InvokeReply RemotePeer::invoke( const OID& oid, const std::string& method,
                                const Strings& args )
{
    OCommand request( CMD_KERNEL_INVOKE );
    request << oid << method << args;

    ICommand reply( 0, _impl->client.call( request ));
    Client::checkReply( reply );

    InvokeReply result;
    reply >> result.status >> result.value;
    return result;
}

void RemotePeer::receiveMigratedObject( const OID& oid,
                                        const Snapshot& snapshot )
{
    OCommand request( CMD_KERNEL_RECEIVE_OBJECT );
    request << oid << snapshot;

    ICommand reply( 0, _impl->client.call( request ));
    Client::checkReply( reply );
}

OID RemotePeer::createObject( const std::string& type, const Strings& args )
{
    OCommand request( CMD_KERNEL_CREATE_OBJECT );
    request << type << args;

    ICommand reply( 0, _impl->client.call( request ));
    Client::checkReply( reply );
    return reply.read< OID >();
}

void RemotePeer::moveObject( const OID& oid, const NodeAddress& destination )
{
    OCommand request( CMD_KERNEL_MOVE_OBJECT );
    request << oid << destination;

    ICommand reply( 0, _impl->client.call( request ));
    Client::checkReply( reply );
}

}
