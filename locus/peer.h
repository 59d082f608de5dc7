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

#ifndef LOCUS_PEER_H
#define LOCUS_PEER_H

#include <locus/api.h>
#include <locus/nodeAddress.h> // return value
#include <locus/types.h>

#include <lunchbox/referenced.h> // base class

namespace locus
{
/** The outcome of one invocation on one kernel server. */
struct InvokeReply
{
    enum Status
    {
        STATUS_OK,            //!< value holds the result
        STATUS_NOT_HERE,      //!< the object is not resident on the node
        STATUS_INVALID_STATE, //!< the object is frozen, retry later
        STATUS_REMOTE_ERROR   //!< value holds the application error
    };

    InvokeReply() : status( STATUS_OK ) {}
    InvokeReply( const uint32_t status_, const std::string& value_ )
        : status( status_ ), value( value_ ) {}

    uint32_t status;
    std::string value;
};

/**
 * The inbound request surface of one kernel server.
 *
 * Implemented by the KernelServer itself and by the RemotePeer proxy.
 * Remote implementations raise an Exception of type UNREACHABLE or
 * CONNECTION_LOST if the kernel server can't be contacted.
 */
class Peer : public lunchbox::Referenced
{
public:
    /**
     * Invoke a method of a resident object.
     *
     * Application failures are reported in the reply, never thrown.
     * @version 1.0
     */
    virtual InvokeReply invoke( const OID& oid, const std::string& method,
                                const Strings& args ) = 0;

    /**
     * Install an object received by migration.
     *
     * @throw Exception DUPLICATE if the object is already resident.
     * @throw Exception DESERIALIZATION if the snapshot is invalid.
     * @version 1.0
     */
    virtual void receiveMigratedObject( const OID& oid,
                                        const Snapshot& snapshot ) = 0;

    /** Create a new object on the node. @version 1.0 */
    virtual OID createObject( const std::string& type,
                              const Strings& args ) = 0;

    /** Move a resident object to another node. @version 1.0 */
    virtual void moveObject( const OID& oid,
                             const NodeAddress& destination ) = 0;

    /** @return the address of the kernel server. @version 1.0 */
    virtual NodeAddress getAddress() const = 0;

protected:
    Peer() {}
    virtual ~Peer() {}
};
}

#endif // LOCUS_PEER_H
