# if !defined( __arbor_schema_hpp__ )
# define __arbor_schema_hpp__
# include "exceptions.hpp"
# include <mtc/zmap.h>
# include <string_view>
# include <memory>
# include <string>
# include <vector>
# include <map>

namespace arbor {
namespace schema {

  using Extensions = std::map<std::string, std::vector<std::string>>;

  struct ObjectClass
  {
    enum: unsigned
    {
      Abstract = 0,
      Structural = 1,
      Auxiliary = 2
    };

    std::string               oid;
    std::vector<std::string>  names;
    std::string               desc;
    bool                      obsolete = false;
    std::vector<std::string>  sup;
    unsigned                  kind = Structural;
    std::vector<std::string>  must;           // effective, superiors first
    std::vector<std::string>  may;            // effective, superiors first
    std::vector<std::string>  declaredMust;
    std::vector<std::string>  declaredMay;
    Extensions                extensions;

    auto  GetName() const -> const std::string&
      {  return names.empty() ? oid : names.front();  }
  };

  struct AttributeType
  {
    enum: unsigned
    {
      userApplications = 0,
      directoryOperation = 1,
      distributedOperation = 2,
      dSAOperation = 3
    };

    std::string               oid;
    std::vector<std::string>  names;
    std::string               desc;
    bool                      obsolete = false;
    std::string               sup;
    std::string               equality;
    std::string               ordering;
    std::string               substr;
    std::string               syntaxOid;
    unsigned                  syntaxLen = 0;
    bool                      singleValued = false;
    bool                      collective = false;
    bool                      noUserModification = false;
    unsigned                  usage = userApplications;
    Extensions                extensions;

    auto  GetName() const -> const std::string&
      {  return names.empty() ? oid : names.front();  }
    bool  IsOperational() const
      {  return usage != userApplications;  }
  };

  struct LdapSyntax
  {
    std::string               oid;
    std::string               desc;
    Extensions                extensions;
  };

  struct MatchingRule
  {
    std::string               oid;
    std::vector<std::string>  names;
    std::string               desc;
    bool                      obsolete = false;
    std::string               syntaxOid;
    Extensions                extensions;
  };

  struct MatchingRuleUse
  {
    std::string               oid;
    std::vector<std::string>  names;
    std::string               desc;
    bool                      obsolete = false;
    std::vector<std::string>  applies;
    Extensions                extensions;
  };

 /*
  * Definition parsers
  *
  * Parse RFC 4512 definition strings, throw ParseError on malformed input.
  * ObjectClass::must and ObjectClass::may returned by ParseObjectClass()
  * hold the declared attributes only; the inherited ones are added by
  * ParseSchema().
  */
  auto  ParseObjectClass( const std::string_view& ) -> ObjectClass;
  auto  ParseAttributeType( const std::string_view& ) -> AttributeType;
  auto  ParseLdapSyntax( const std::string_view& ) -> LdapSyntax;
  auto  ParseMatchingRule( const std::string_view& ) -> MatchingRule;
  auto  ParseMatchingRuleUse( const std::string_view& ) -> MatchingRuleUse;

 /*
  * Schema
  *
  * Immutable parsed schema; descriptors are found by numeric OID or by any
  * of their names, case-insensitively.
  */
  class Schema
  {
    struct impl;

    std::shared_ptr<const impl> data;

    friend  auto  ParseSchema( const mtc::zmap& ) -> Schema;

  public:
    auto  GetObjectClass( const std::string_view& ) const -> const ObjectClass*;
    auto  GetAttributeType( const std::string_view& ) const -> const AttributeType*;
    auto  GetLdapSyntax( const std::string_view& ) const -> const LdapSyntax*;
    auto  GetMatchingRule( const std::string_view& ) const -> const MatchingRule*;
    auto  GetMatchingRuleUse( const std::string_view& ) const -> const MatchingRuleUse*;

    auto  ListObjectClasses() const -> std::vector<const ObjectClass*>;
    auto  ListAttributeTypes() const -> std::vector<const AttributeType*>;

    bool  empty() const;
  };

 /*
  * ParseSchema( dump )
  *
  * Builds the schema from the raw directory dump with the arrays of
  * definition strings under "objectClasses", "attributeTypes",
  * "ldapSyntaxes", "matchingRules" and "matchingRuleUse" keys.
  *
  * Throws ParseError on malformed definitions and SchemaCycle on cyclic
  * SUP references.
  */
  auto  ParseSchema( const mtc::zmap& ) -> Schema;

}}

# endif   // !__arbor_schema_hpp__
