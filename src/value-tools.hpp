# if !defined( __arbor_src_value_tools_hpp__ )
# define __arbor_src_value_tools_hpp__
# include <mtc/zmap.h>
# include <string_view>
# include <string>
# include <vector>

namespace arbor {

 /*
  * ToString( zval )
  *
  * Returns the string form of a scalar value; wide strings are converted
  * to utf-8. Throws std::invalid_argument for structures and arrays.
  */
  auto  ToString( const mtc::zval& ) -> std::string;

 /*
  * GetStrings( zval )
  *
  * Returns the value as a list of strings: scalars give one element,
  * arrays give one element per array item.
  */
  auto  GetStrings( const mtc::zval& ) -> std::vector<std::string>;

  auto  LowerCase( const std::string_view& ) -> std::string;
  bool  EqualNoCase( const std::string_view&, const std::string_view& ) noexcept;

 /*
  * Raw entry access
  *
  * Raw entries map attribute names to arrays of strings; names are matched
  * case-insensitively.
  */
  auto  FindAttribute( const mtc::zmap&, const std::string_view& ) -> const mtc::zval*;
  auto  GetAttribute( const mtc::zmap&, const std::string_view& ) -> std::vector<std::string>;
  void  SetAttribute( mtc::zmap&, const std::string_view&, const std::vector<std::string>& );
  void  DelAttribute( mtc::zmap&, const std::string_view& );

}

# endif   // !__arbor_src_value_tools_hpp__
