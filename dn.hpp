# if !defined( __arbor_dn_hpp__ )
# define __arbor_dn_hpp__
# include "exceptions.hpp"
# include <string_view>
# include <string>
# include <vector>

namespace arbor {
namespace dn {

 /*
  * Distinguished names
  *
  * A DN is a comma-separated list of RDN components ordered from the most
  * specific one to the least specific; each RDN is one or more attribute=value
  * pairs joined by '+'.
  *
  * Values in Pair are kept unescaped; MakeRdn() and Normalize() produce the
  * escaped RFC 4514 string representation. Parsing and formatting are done
  * by libldap.
  */
  struct Pair
  {
    std::string attr;
    std::string value;
  };

  using RDN = std::vector<Pair>;

  auto  SplitDn( const std::string_view&, unsigned limit = 0 ) -> std::vector<std::string>;

  auto  ParseRdn( const std::string_view& ) -> RDN;                 // throws InvalidDN for not a single RDN
  auto  ParseDn( const std::string_view& ) -> std::vector<RDN>;     // throws InvalidDN
  bool  IsValid( const std::string_view& ) noexcept;

  auto  MakeRdn( const RDN& ) -> std::string;
  auto  MakeRdn( const std::string_view& attr, const std::string_view& value ) -> std::string;

  auto  Normalize( const std::string_view& ) -> std::string;        // throws InvalidDN
  auto  GetParent( const std::string_view& ) -> std::string;

 /*
  * IsAncestorOrSelf( base, dn )
  *
  * Returns true if base is a suffix of dn on RDN component boundaries.
  * Attribute names and values are compared case-insensitively.
  */
  bool  IsAncestorOrSelf( const std::string_view& base, const std::string_view& dn );

 /*
  * Compare( a, b )
  *
  * Compares the DNs component by component starting from the least specific
  * end; if one DN is the suffix of another, the shorter one (the ancestor)
  * goes first.
  */
  int   Compare( const std::string_view&, const std::string_view& );

}}

# endif   // !__arbor_dn_hpp__
