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

#ifndef LOCUS_HOSTEDOBJECT_H
#define LOCUS_HOSTEDOBJECT_H

#include <locus/api.h>
#include <locus/types.h>

#include <lunchbox/referenced.h> // base class
#include <boost/noncopyable.hpp> // base class

namespace locus
{
namespace detail { class HostedObject; }

/**
 * The node-local wrapper of one application Object.
 *
 * A hosted object is invokable only while it is active. Freezing it produces
 * a snapshot of the object for a migration, during and after which the
 * object rejects invocations. Invocations of different hosted objects never
 * block each other.
 *
 * The snapshot encoding is versioned:
 * <code>uint32 magic | uint32 version | OID | string type |
 *       uint64 size | instance data</code>
 */
class HostedObject : public lunchbox::Referenced, public boost::noncopyable
{
public:
    enum State //! The state of a hosted object @version 1.0
    {
        STATE_INACTIVE, //!< Created, not yet activated
        STATE_ACTIVE,   //!< Resident and invokable
        STATE_FROZEN    //!< Snapshot produced, not invokable
    };

    /** The first word of every snapshot. */
    static const uint32_t SNAPSHOT_MAGIC = 0x4C4F4353u; // 'LOCS'
    /** The current snapshot encoding version. */
    static const uint32_t SNAPSHOT_VERSION = 1u;

    /**
     * Construct a new, inactive hosted object.
     *
     * @param oid the identifier of the object.
     * @param type the factory type name of the object.
     * @param object the application object, deleted using the factory.
     * @param factory the factory which created the object.
     * @version 1.0
     */
    LOCUS_API HostedObject( const OID& oid, const std::string& type,
                            Object* object, ObjectFactory& factory );

    /**
     * Instantiate an object from a snapshot.
     *
     * @return the new, active hosted object.
     * @throw Exception DESERIALIZATION if the snapshot is malformed, of an
     *        unsupported version, of an unknown type, or was produced for
     *        another OID.
     * @version 1.0
     */
    LOCUS_API static HostedObjectPtr activate( const OID& oid,
                                               const Snapshot& snapshot,
                                               ObjectFactory& factory );

    /** @name Data Access */
    //@{
    /** @return the identifier of the object. @version 1.0 */
    LOCUS_API const OID& getOID() const;

    /** @return the type name of the object. @version 1.0 */
    LOCUS_API const std::string& getType() const;

    /** @return the current state. @version 1.0 */
    LOCUS_API State getState() const;

    /** @return true if the object is invokable. @version 1.0 */
    bool isActive() const { return getState() == STATE_ACTIVE; }

    /** @return true if the object has been frozen. @version 1.0 */
    bool isFrozen() const { return getState() == STATE_FROZEN; }

    /** @return the application object. @version 1.0 */
    LOCUS_API Object* getObject();
    //@}

    /** @name Operations */
    //@{
    /**
     * Invoke a method of the application object.
     *
     * @return the result of the method.
     * @throw Exception INVALID_STATE if the object is not active or a freeze
     *        is in progress.
     * @throw Exception INVOCATION if the method does not exist or failed.
     * @version 1.0
     */
    LOCUS_API std::string invoke( const std::string& method,
                                  const Strings& args );

    /**
     * Freeze the object and serialize it.
     *
     * New invocations are rejected from the start of the freeze, the freeze
     * waits for in-flight invocations to finish. Freezing a frozen object
     * returns the retained snapshot.
     *
     * @return the snapshot of the object.
     * @throw Exception SERIALIZATION if the instance data could not be
     *        written, the object stays active.
     * @throw Exception INVALID_STATE if the object is inactive.
     * @version 1.0
     */
    LOCUS_API Snapshot freeze();

    /**
     * Reactivate a frozen object, e.g., after a failed transfer.
     *
     * Thawing an active object has no effect.
     * @throw Exception INVALID_STATE if the object is inactive.
     * @version 1.0
     */
    LOCUS_API void thaw();

    /**
     * Make the object inactive and drop a retained snapshot.
     *
     * Called when the object leaves the node. References still held
     * elsewhere can neither invoke nor freeze it afterwards.
     * @version 1.0
     */
    LOCUS_API void deactivate();

    /**
     * @internal Mark a newly instantiated object as active.
     * @throw Exception INVALID_STATE if the object is not inactive.
     */
    LOCUS_API void setActive();
    //@}

protected:
    LOCUS_API virtual ~HostedObject();

private:
    detail::HostedObject* const _impl;
};

LOCUS_API std::ostream& operator << ( std::ostream&, const HostedObject& );
}
#endif // LOCUS_HOSTEDOBJECT_H
