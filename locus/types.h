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

#ifndef LOCUS_TYPES_H
#define LOCUS_TYPES_H

#include <lunchbox/refPtr.h>
#include <lunchbox/types.h>
#include <servus/uint128_t.h>

#include <string>
#include <vector>

namespace locus
{
class Buffer;
class Client;
class Connection;
class DataIStream;
class DataOStream;
class Directory;
class DirectoryServer;
class Dispatcher;
class Global;
class HostedObject;
class ICommand;
class KernelServer;
class LocalDirectory;
class OCommand;
class Object;
class ObjectFactory;
class ObjectRegistry;
class Peer;
class PeerClient;
class RemoteDirectory;
class RemotePeer;
class Server;
class SocketConnection;
struct InvokeReply;
struct NodeAddress;

using servus::uint128_t;

typedef uint128_t OID; //!< The cluster-wide identifier of an object
typedef std::vector< OID > OIDs; //!< A vector of object identifiers

/** An ordered list of method arguments. */
typedef std::vector< std::string > Strings;
/** A const iterator for Strings. */
typedef Strings::const_iterator StringsCIter;

/** The serialized form of a frozen object. */
typedef std::vector< uint8_t > Snapshot;

/** A vector of node addresses. */
typedef std::vector< NodeAddress > NodeAddresses;
/** A const iterator for a vector of node addresses. */
typedef NodeAddresses::const_iterator NodeAddressesCIter;

/** A reference pointer for Buffer pointers. */
typedef lunchbox::RefPtr< Buffer >             BufferPtr;
/** A reference pointer for const Buffer pointers. */
typedef lunchbox::RefPtr< const Buffer >       ConstBufferPtr;
/** A reference pointer for Connection pointers. */
typedef lunchbox::RefPtr< Connection >         ConnectionPtr;
/** A vector of ConnectionPtr's. */
typedef std::vector< ConnectionPtr >           Connections;
/** A const iterator for a vector of ConnectionPtr's. */
typedef Connections::const_iterator            ConnectionsCIter;
/** A reference pointer for Directory pointers. */
typedef lunchbox::RefPtr< Directory >          DirectoryPtr;
/** A reference pointer for LocalDirectory pointers. */
typedef lunchbox::RefPtr< LocalDirectory >     LocalDirectoryPtr;
/** A reference pointer for HostedObject pointers. */
typedef lunchbox::RefPtr< HostedObject >       HostedObjectPtr;
/** A reference pointer for Peer pointers. */
typedef lunchbox::RefPtr< Peer >               PeerPtr;
/** A reference pointer for KernelServer pointers. */
typedef lunchbox::RefPtr< KernelServer >       KernelServerPtr;
}
#endif // LOCUS_TYPES_H
