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

#ifndef LOCUS_REMOTEPEER_H
#define LOCUS_REMOTEPEER_H

#include <locus/peer.h> // base class

namespace locus
{
namespace detail { class RemotePeer; }

/** A proxy for a kernel server on another node. */
class RemotePeer : public Peer
{
public:
    /** Construct a proxy for the kernel server at the given address. */
    LOCUS_API explicit RemotePeer( const NodeAddress& address );

    LOCUS_API InvokeReply invoke( const OID& oid, const std::string& method,
                                  const Strings& args ) override;
    LOCUS_API void receiveMigratedObject( const OID& oid,
                                          const Snapshot& snapshot ) override;
    LOCUS_API OID createObject( const std::string& type,
                                const Strings& args ) override;
    LOCUS_API void moveObject( const OID& oid,
                               const NodeAddress& destination ) override;
    LOCUS_API NodeAddress getAddress() const override;

    /** @return the default connector creating RemotePeer instances. */
    LOCUS_API static PeerPtr create( const NodeAddress& address );

protected:
    LOCUS_API virtual ~RemotePeer();

private:
    detail::RemotePeer* const _impl;
};
}

#endif // LOCUS_REMOTEPEER_H
