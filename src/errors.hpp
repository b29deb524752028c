#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <stdexcept>
#include <string>

/**
 * @brief Classes of failures reported by the printing pipeline.
 *
 * Input errors are raised synchronously before any I/O. Connection, transport
 * and link-loss errors come from the link layer. Persistence errors come from
 * the pending job store. Render errors are raised by the page rasterizers.
 */
enum class ErrorClass
{
  NONE,
  INPUT,
  CONNECTION,
  TRANSPORT,
  LINK_LOST,
  PERSISTENCE,
  RENDER,
  CANCELED
};

extern std::string error_class_name( const ErrorClass );

/**
 * @brief Common interface of all exceptions carrying an error class.
 */
class thermal_error
{
public:
  explicit thermal_error( const ErrorClass c ) : _class( c ){}
  virtual ~thermal_error(){}

  ErrorClass error_class() const { return _class; }

private:
  ErrorClass _class;
};

class input_error : public std::invalid_argument, public thermal_error
{
public:
  explicit input_error( const std::string& msg ) :
    std::invalid_argument( msg ),
    thermal_error( ErrorClass::INPUT ){}
};

class connection_error : public std::runtime_error, public thermal_error
{
public:
  explicit connection_error( const std::string& msg ) :
    std::runtime_error( msg ),
    thermal_error( ErrorClass::CONNECTION ){}
};

class transport_error : public std::runtime_error, public thermal_error
{
public:
  explicit transport_error( const std::string& msg ) :
    std::runtime_error( msg ),
    thermal_error( ErrorClass::TRANSPORT ){}
};

class link_lost_error : public std::runtime_error, public thermal_error
{
public:
  explicit link_lost_error( const std::string& msg ) :
    std::runtime_error( msg ),
    thermal_error( ErrorClass::LINK_LOST ){}
};

class persistence_error : public std::runtime_error, public thermal_error
{
public:
  explicit persistence_error( const std::string& msg ) :
    std::runtime_error( msg ),
    thermal_error( ErrorClass::PERSISTENCE ){}
};

class render_error : public std::runtime_error, public thermal_error
{
public:
  explicit render_error( const std::string& msg ) :
    std::runtime_error( msg ),
    thermal_error( ErrorClass::RENDER ){}
};

class job_canceled : public std::runtime_error, public thermal_error
{
public:
  explicit job_canceled( const std::string& msg ) :
    std::runtime_error( msg ),
    thermal_error( ErrorClass::CANCELED ){}
};

#endif
