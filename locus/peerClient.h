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

#ifndef LOCUS_PEERCLIENT_H
#define LOCUS_PEERCLIENT_H

#include <locus/api.h>
#include <locus/types.h>

#include <boost/function.hpp>
#include <boost/noncopyable.hpp>

namespace locus
{
namespace detail { class PeerClient; }

/**
 * The location-transparent, outbound request path to kernel servers.
 *
 * Caches the last known location of objects and one Peer per node. An
 * invocation of a moved object is transparently retried on its new host.
 */
class PeerClient : public boost::noncopyable
{
public:
    /** Creates the Peer for a node address. @version 1.0 */
    typedef boost::function< PeerPtr( const NodeAddress& ) > Connector;

    /**
     * Construct a new peer client.
     *
     * @param directory the directory used to resolve object locations.
     * @param connector creates peers, by default RemotePeer::create().
     * @param local the peer of the own node, used without connecting.
     * @version 1.0
     */
    LOCUS_API explicit PeerClient( DirectoryPtr directory,
                                   const Connector& connector = Connector(),
                                   Peer* local = 0 );

    LOCUS_API virtual ~PeerClient();

    /**
     * Invoke a method of an object, wherever it is hosted.
     *
     * @return the result of the method.
     * @throw Exception REMOTE_INVOCATION if the method failed.
     * @throw Exception NOT_FOUND if the object could not be reached within
     *        Global::IATTR_INVOKE_RETRIES attempts.
     * @throw Exception UNKNOWN_OID if the object never existed.
     * @version 1.0
     */
    LOCUS_API std::string invoke( const OID& oid, const std::string& method,
                                  const Strings& args );

    /**
     * Send a frozen object to the destination node.
     *
     * Retried up to Global::IATTR_TRANSFER_RETRIES times if the destination
     * could not be reached at all.
     *
     * @throw Exception UNREACHABLE, CONNECTION_LOST, DUPLICATE or
     *        DESERIALIZATION.
     * @version 1.0
     */
    LOCUS_API void transferObject( const NodeAddress& destination,
                                   const OID& oid, const Snapshot& snapshot );

    /** @return a new object created on the given node. @version 1.0 */
    LOCUS_API OID createObject( const NodeAddress& node,
                                const std::string& type, const Strings& args );

    /**
     * Ask the current host of an object to move it to the destination.
     * @version 1.0
     */
    LOCUS_API void moveObject( const OID& oid, const NodeAddress& destination );

    /** @name Caches */
    //@{
    /** @return the last known location of the object. @version 1.0 */
    LOCUS_API NodeAddress resolve( const OID& oid );

    /** Forget the cached location of the object. @version 1.0 */
    LOCUS_API void invalidate( const OID& oid );

    /** Set the cached location of the object. @version 1.0 */
    LOCUS_API void setLocation( const OID& oid, const NodeAddress& node );

    /** @return the peer for the given node. @version 1.0 */
    LOCUS_API PeerPtr getPeer( const NodeAddress& node );

    /** Release the peer of the given node. @version 1.0 */
    LOCUS_API void releasePeer( const NodeAddress& node );

    /** Release all peers and cached locations. @version 1.0 */
    LOCUS_API void clear();
    //@}

    /** @return the directory used to resolve locations. @version 1.0 */
    LOCUS_API DirectoryPtr getDirectory() const;

private:
    detail::PeerClient* const _impl;
};
}

#endif // LOCUS_PEERCLIENT_H
