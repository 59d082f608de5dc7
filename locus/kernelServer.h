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

#ifndef LOCUS_KERNELSERVER_H
#define LOCUS_KERNELSERVER_H

#include <locus/peer.h>       // base class
#include <locus/peerClient.h> // nested type
#include <locus/server.h>     // base class

namespace locus
{
namespace detail { class KernelServer; }

/**
 * Hosts objects on one node and moves them between nodes.
 *
 * A kernel server owns the ObjectRegistry of its node and a PeerClient to
 * reach the other kernel servers. It serves its Peer interface to remote
 * nodes once listening.
 *
 * Moving an object follows a fixed protocol: the object is frozen and
 * serialized at the source, transferred to and installed at the
 * destination, the directory is updated, and the source copy is removed. At
 * no time is more than one copy of the object active.
 */
class KernelServer : public Peer, public Server
{
public:
    /**
     * Construct a new kernel server.
     *
     * @param host the address of this node, used for listening and in the
     *             directory.
     * @param directory the directory of the cluster.
     * @param factory the factory instantiating application objects.
     * @param connector creates peers for other nodes, by default RemotePeer.
     * @version 1.0
     */
    LOCUS_API KernelServer( const NodeAddress& host, DirectoryPtr directory,
                            ObjectFactory& factory,
                            const PeerClient::Connector& connector =
                                PeerClient::Connector( ));

    /** @name Peer interface */
    //@{
    /**
     * Invoke a method of a resident object.
     *
     * @return STATUS_NOT_HERE if the object is not resident,
     *         STATUS_INVALID_STATE if it is frozen, STATUS_REMOTE_ERROR with
     *         the error message if the method failed, or STATUS_OK with the
     *         result.
     * @version 1.0
     */
    LOCUS_API InvokeReply invoke( const OID& oid, const std::string& method,
                                  const Strings& args ) override;

    LOCUS_API void receiveMigratedObject( const OID& oid,
                                          const Snapshot& snapshot ) override;

    /**
     * Create a new object on this node.
     *
     * The object is registered in the directory when this method returns.
     * @version 1.0
     */
    LOCUS_API OID createObject( const std::string& type,
                                const Strings& args ) override;

    /**
     * Move a resident object to another node.
     *
     * Moving an object to this node has no effect. If the destination
     * can't be reached or rejects the snapshot, the object stays frozen
     * until it is moved again or reactivated. If the transfer was sent but
     * not confirmed, or the directory can't be updated after
     * Global::IATTR_DIRECTORY_RETRIES attempts, the migration stays pending
     * and is completed by moving the object to the same destination again.
     *
     * @throw Exception NOT_FOUND if the object is not resident.
     * @throw Exception INVALID_STATE if the object is already being moved,
     *        or a pending migration has another destination.
     * @throw Exception SERIALIZATION if the object could not be frozen.
     * @throw Exception TRANSFER or DUPLICATE if the object could not be
     *        installed at the destination.
     * @throw Exception DIRECTORY_UNAVAILABLE if the directory update failed.
     * @version 1.0
     */
    LOCUS_API void moveObject( const OID& oid,
                               const NodeAddress& destination ) override;

    /** @return the address of this node. @version 1.0 */
    LOCUS_API NodeAddress getAddress() const override;
    //@}

    /** @name Operations */
    //@{
    /**
     * Reactivate a frozen object after an incomplete migration.
     *
     * @throw Exception INVALID_STATE if the object is being moved, or its
     *        migration is pending.
     * @throw Exception NOT_FOUND if the object is not resident.
     * @version 1.0
     */
    LOCUS_API void reactivateObject( const OID& oid );

    /**
     * @return the objects whose migration waits for a transfer retry or a
     *         directory update.
     * @version 1.0
     */
    LOCUS_API OIDs getPendingMigrations() const;

    /** Register this node in the directory. @version 1.0 */
    LOCUS_API void registerWithDirectory( const std::string& region );

    /**
     * Start serving requests on the host address.
     *
     * The host address is published in the directory, so it needs a fixed,
     * non-zero port.
     * @version 1.0
     */
    LOCUS_API bool listen();

    /** Stop serving requests and release all peers. @version 1.0 */
    LOCUS_API void close();
    //@}

    /** @name Data Access */
    //@{
    LOCUS_API ObjectRegistry& getRegistry();
    LOCUS_API PeerClient& getPeerClient();
    LOCUS_API DirectoryPtr getDirectory() const;
    //@}

protected:
    LOCUS_API virtual ~KernelServer();

private:
    detail::KernelServer* const _impl;

    void _transferObject( HostedObject& hosted,
                          const NodeAddress& destination, bool retry );
    void _updateDirectory( const OID& oid, const NodeAddress& destination );

    void _cmdInvoke( ICommand& command, OCommand& reply );
    void _cmdReceiveObject( ICommand& command, OCommand& reply );
    void _cmdCreateObject( ICommand& command, OCommand& reply );
    void _cmdMoveObject( ICommand& command, OCommand& reply );
};
}

#endif // LOCUS_KERNELSERVER_H
