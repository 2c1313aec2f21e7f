# if !defined( __arbor_src_schema_definitions_hpp__ )
# define __arbor_src_schema_definitions_hpp__
# include "../../schema.hpp"
# include <string_view>
# include <string>
# include <vector>
# include <map>

namespace arbor {
namespace schema {

 /*
  * Definition
  *
  * Generic RFC 4512 definition: numeric OID followed by the keyword fields.
  * Keywords are stored upper-cased; flag keywords hold no values.
  */
  struct Definition
  {
    std::string                                     oid;
    std::map<std::string, std::vector<std::string>> fields;

    bool  Has( const char* ) const;
    auto  Get( const char* ) const -> std::string;
    auto  List( const char* ) const -> std::vector<std::string>;
    auto  Extensions() const -> schema::Extensions;
  };

  auto  ParseDefinition( const std::string_view& ) -> Definition;     // throws ParseError

}}

# endif   // !__arbor_src_schema_definitions_hpp__
