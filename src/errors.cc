#include "errors.hpp"

std::string
error_class_name( const ErrorClass c )
{
  switch( c ){
  case ErrorClass::NONE:        return "none";
  case ErrorClass::INPUT:       return "input";
  case ErrorClass::CONNECTION:  return "connection";
  case ErrorClass::TRANSPORT:   return "transport";
  case ErrorClass::LINK_LOST:   return "link-lost";
  case ErrorClass::PERSISTENCE: return "persistence";
  case ErrorClass::RENDER:      return "render";
  case ErrorClass::CANCELED:    return "canceled";
  }
  return "unknown";
}
