#ifndef SCOPELOG_EXCEPTION_HPP
#define SCOPELOG_EXCEPTION_HPP

#include <exception>
#include <string>

namespace scopelog {


    /*!  @file      exception.hpp
     *   @details   Exceptions thrown by the library. Callers can catch scopelog::Exception
     *              to handle everything originating from here in one place.
     *   @name      Exceptions
     */

    /*!  @class     Exception
     *   @brief     Base class for all exceptions.
     */
    class Exception : public std::exception {
    public:
        Exception( void ) : message( "Exception" ) {}
        Exception( const std::string &message ) : message( message ) {}
        virtual ~Exception( void ) throw() {}

        virtual const char *what( void ) const throw() {
            return message.c_str();
        }

    private:
        const std::string message;
    };


    /*!  @class     UnrecoverableException
     *   @brief     Exception that will rise again if the failed operation is retried.
     */
    class UnrecoverableException : public Exception {
    public:
        UnrecoverableException( void ) : Exception( "UnrecoverableException" ) {}
        UnrecoverableException( const std::string &message ) : Exception( message ) {}
        virtual ~UnrecoverableException( void ) throw() {}
    };


    /*!  @class     BadArgument
     *   @brief     Exception that indicates that something has been invoked with
     *              bad arguments.
     */
    class BadArgument : public UnrecoverableException {
    public:
        BadArgument( void ) : UnrecoverableException( "BadArgument" ) {}
        BadArgument( const std::string &message ) : UnrecoverableException( message ) {}

        virtual ~BadArgument( void ) throw() {}
    };


}

#endif // SCOPELOG_EXCEPTION_HPP
