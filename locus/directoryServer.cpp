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

#include "directoryServer.h"

#include "directory.h"
#include "iCommand.h"
#include "log.h"
#include "nodeAddress.h"
#include "oCommand.h"

#include <lunchbox/debug.h>

#include <boost/bind.hpp>

namespace locus
{
DirectoryServer::DirectoryServer( DirectoryPtr directory )
    : _directory( directory )
{
    LBASSERT( directory );
    registerCommand( CMD_DIRECTORY_ALLOCATE,
                     boost::bind( &DirectoryServer::_cmdAllocate, this,
                                  _1, _2 ));
    registerCommand( CMD_DIRECTORY_RESOLVE,
                     boost::bind( &DirectoryServer::_cmdResolve, this,
                                  _1, _2 ));
    registerCommand( CMD_DIRECTORY_UPDATE_LOCATION,
                     boost::bind( &DirectoryServer::_cmdUpdateLocation, this,
                                  _1, _2 ));
    registerCommand( CMD_DIRECTORY_REGISTER_NODE,
                     boost::bind( &DirectoryServer::_cmdRegisterNode, this,
                                  _1, _2 ));
    registerCommand( CMD_DIRECTORY_GET_NODES,
                     boost::bind( &DirectoryServer::_cmdGetNodes, this,
                                  _1, _2 ));
}

DirectoryServer::~DirectoryServer()
{
    close();
}

//----------------------------------------------------------------------
// Command handlers
//----------------------------------------------------------------------
void DirectoryServer::_cmdAllocate( ICommand& command, OCommand& reply )
{
    const NodeAddress node = command.read< NodeAddress >();
    reply << _directory->allocate( node );
}

void DirectoryServer::_cmdResolve( ICommand& command, OCommand& reply )
{
    const OID oid = command.read< OID >();
    reply << _directory->resolve( oid );
}

void DirectoryServer::_cmdUpdateLocation( ICommand& command, OCommand& )
{
    const OID oid = command.read< OID >();
    const NodeAddress node = command.read< NodeAddress >();
    _directory->updateLocation( oid, node );
}

void DirectoryServer::_cmdRegisterNode( ICommand& command, OCommand& )
{
    const NodeAddress node = command.read< NodeAddress >();
    const std::string region = command.read< std::string >();
    _directory->registerNode( node, region );
}

void DirectoryServer::_cmdGetNodes( ICommand& command, OCommand& reply )
{
    const std::string region = command.read< std::string >();
    reply << _directory->getNodes( region );
}

}
