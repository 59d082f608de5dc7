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

#ifndef LOCUS_EXCEPTION_H
#define LOCUS_EXCEPTION_H

#include <lunchbox/types.h>

#include <exception>
#include <sstream>
#include <string>

namespace locus
{
    class Exception;
    std::ostream& operator << ( std::ostream& os, const Exception& e );

    /** The base Exception for all Locus operations. */
    class Exception : public std::exception
    {
    public:
        /** The exception type. @version 1.0 */
        enum Type
        {
            NOT_FOUND,             //!< Object not resident on this node
            INVALID_STATE,         //!< Object present but not invocable
            DUPLICATE,             //!< Registry already holds the object
            SERIALIZATION,         //!< Object state could not be written
            DESERIALIZATION,       //!< Malformed or incompatible snapshot
            ALLOCATION,            //!< No identifier could be allocated
            DIRECTORY_UNAVAILABLE, //!< Directory could not be reached
            UNKNOWN_OID,           //!< Identifier never registered
            INSTANTIATION,         //!< Application object creation failed
            INVOCATION,            //!< Application method failed locally
            REMOTE_INVOCATION,     //!< Application method failed remotely
            UNREACHABLE,           //!< Remote node could not be connected
            CONNECTION_LOST,       //!< Connection failed during a request
            TRANSFER,              //!< Migration transfer did not complete
            PROTOCOL,              //!< Malformed or unexpected command
            CUSTOM      = 20       //!< Application-specific exceptions
        };

        /** Construct a new Exception. @version 1.0 */
        explicit Exception( const uint32_t type,
                            const std::string& message = std::string( ))
            : _type( type )
            , _message( message )
        {
            std::ostringstream os;
            os << getTypeName( type );
            if( !message.empty( ))
                os << ": " << message;
            _what = os.str();
        }

        /** Destruct this exception. @version 1.0 */
        virtual ~Exception() throw() {}

        /** @return the type of this exception @version 1.0 */
        virtual uint32_t getType() const { return _type; }

        /** @return the message without the type name. @version 1.0 */
        const std::string& getMessage() const { return _message; }

        /** Output the exception in human-readable form. @version 1.0 */
        virtual const char* what() const throw() { return _what.c_str(); }

        /** @return the name of the given exception type. @version 1.0 */
        static const char* getTypeName( const uint32_t type )
        {
            switch( type )
            {
              case NOT_FOUND:             return "Object not found";
              case INVALID_STATE:         return "Invalid object state";
              case DUPLICATE:             return "Duplicate object";
              case SERIALIZATION:         return "Serialization error";
              case DESERIALIZATION:       return "Deserialization error";
              case ALLOCATION:            return "Allocation error";
              case DIRECTORY_UNAVAILABLE: return "Directory unavailable";
              case UNKNOWN_OID:           return "Unknown object identifier";
              case INSTANTIATION:         return "Instantiation error";
              case INVOCATION:            return "Invocation error";
              case REMOTE_INVOCATION:     return "Remote invocation error";
              case UNREACHABLE:           return "Node unreachable";
              case CONNECTION_LOST:       return "Connection lost";
              case TRANSFER:              return "Transfer error";
              case PROTOCOL:              return "Protocol error";
              default:                    return "Unknown Exception";
            }
        }

    private:
        /** The type of this exception instance **/
        uint32_t _type;
        std::string _message;
        std::string _what;
    };

    /** Output the exception in human-readable form. @version 1.0 */
    inline std::ostream& operator << ( std::ostream& os, const Exception& e )
        { return os << e.what(); }
}

#endif // LOCUS_EXCEPTION_H
