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

#include "remoteDirectory.h"

#include "buffer.h"
#include "client.h"
#include "exception.h"
#include "iCommand.h"
#include "log.h"
#include "nodeAddress.h"
#include "oCommand.h"

namespace locus
{
namespace detail
{
class RemoteDirectory
{
public:
    explicit RemoteDirectory( const NodeAddress& address ) : client( address ) {}

    /** Send the request and return the unchecked reply. */
    BufferPtr call( OCommand& request )
    {
        try
        {
            return client.call( request );
        }
        catch( const Exception& e )
        {
            LBLOG( LOG_RPC ) << "Directory " << client.getAddress()
                             << " failed: " << e.what() << std::endl;
            throw Exception( Exception::DIRECTORY_UNAVAILABLE, e.what( ));
        }
    }

    locus::Client client;
};
}

RemoteDirectory::RemoteDirectory( const NodeAddress& address )
    : _impl( new detail::RemoteDirectory( address ))
{}

RemoteDirectory::~RemoteDirectory()
{
    delete _impl;
}

const NodeAddress& RemoteDirectory::getAddress() const
{
    return _impl->client.getAddress();
}

OID RemoteDirectory::allocate( const NodeAddress& node )
{
    OCommand request( CMD_DIRECTORY_ALLOCATE );
    request << node;

    ICommand reply( 0, _impl->call( request ));
    Client::checkReply( reply );
    return reply.read< OID >();
}

NodeAddress RemoteDirectory::resolve( const OID& oid )
{
    OCommand request( CMD_DIRECTORY_RESOLVE );
    request << oid;

    ICommand reply( 0, _impl->call( request ));
    Client::checkReply( reply );
    return reply.read< NodeAddress >();
}

void RemoteDirectory::updateLocation( const OID& oid, const NodeAddress& node )
{
    OCommand request( CMD_DIRECTORY_UPDATE_LOCATION );
    request << oid << node;

    ICommand reply( 0, _impl->call( request ));
    Client::checkReply( reply );
}

void RemoteDirectory::registerNode( const NodeAddress& node,
                                    const std::string& region )
{
    OCommand request( CMD_DIRECTORY_REGISTER_NODE );
    request << node << region;

    ICommand reply( 0, _impl->call( request ));
    Client::checkReply( reply );
}

NodeAddresses RemoteDirectory::getNodes( const std::string& region )
{
    OCommand request( CMD_DIRECTORY_GET_NODES );
    request << region;

    ICommand reply( 0, _impl->call( request ));
    Client::checkReply( reply );
    return reply.read< NodeAddresses >();
}

}
