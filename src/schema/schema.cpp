# include "../../schema.hpp"
# include "../value-tools.hpp"
# include "definitions.hpp"
# include <spdlog/spdlog.h>
# include <mtc/wcsstr.h>
# include <unordered_map>
# include <type_traits>
# include <cstdlib>
# include <algorithm>

namespace arbor {
namespace schema {

  // definition parsers

  static  auto  GetKind( const Definition& def ) -> unsigned
  {
    if ( def.Has( "ABSTRACT" ) )  return ObjectClass::Abstract;
    if ( def.Has( "AUXILIARY" ) ) return ObjectClass::Auxiliary;
    return ObjectClass::Structural;
  }

  static  auto  GetUsage( const Definition& def ) -> unsigned
  {
    auto  usage = def.Get( "USAGE" );

    if ( usage.empty() || EqualNoCase( usage, "userApplications" ) )
      return AttributeType::userApplications;
    if ( EqualNoCase( usage, "directoryOperation" ) )
      return AttributeType::directoryOperation;
    if ( EqualNoCase( usage, "distributedOperation" ) )
      return AttributeType::distributedOperation;
    if ( EqualNoCase( usage, "dSAOperation" ) )
      return AttributeType::dSAOperation;
    throw ParseError( mtc::strprintf( "invalid attribute type usage '%s'", usage.c_str() ) );
  }

  auto  ParseObjectClass( const std::string_view& str ) -> ObjectClass
  {
    auto  def = ParseDefinition( str );
    auto  out = ObjectClass();

    out.oid = def.oid;
    out.names = def.List( "NAME" );
    out.desc = def.Get( "DESC" );
    out.obsolete = def.Has( "OBSOLETE" );
    out.sup = def.List( "SUP" );
    out.kind = GetKind( def );
    out.must = out.declaredMust = def.List( "MUST" );
    out.may = out.declaredMay = def.List( "MAY" );
    out.extensions = def.Extensions();

    return out;
  }

  auto  ParseAttributeType( const std::string_view& str ) -> AttributeType
  {
    auto  def = ParseDefinition( str );
    auto  out = AttributeType();
    auto  syn = def.Get( "SYNTAX" );
    auto  pos = syn.find( '{' );

    out.oid = def.oid;
    out.names = def.List( "NAME" );
    out.desc = def.Get( "DESC" );
    out.obsolete = def.Has( "OBSOLETE" );
    out.sup = def.Get( "SUP" );
    out.equality = def.Get( "EQUALITY" );
    out.ordering = def.Get( "ORDERING" );
    out.substr = def.Get( "SUBSTR" );
    out.singleValued = def.Has( "SINGLE-VALUE" );
    out.collective = def.Has( "COLLECTIVE" );
    out.noUserModification = def.Has( "NO-USER-MODIFICATION" );
    out.usage = GetUsage( def );
    out.extensions = def.Extensions();

    if ( pos != std::string::npos )
    {
      out.syntaxLen = unsigned(strtoul( syn.c_str() + pos + 1, nullptr, 10 ));
      syn.resize( pos );
    }
    out.syntaxOid = std::move( syn );

    if ( out.sup.empty() && out.syntaxOid.empty() )
      throw ParseError( mtc::strprintf( "attribute type '%s' has neither SUP nor SYNTAX", out.oid.c_str() ) );

    return out;
  }

  auto  ParseLdapSyntax( const std::string_view& str ) -> LdapSyntax
  {
    auto  def = ParseDefinition( str );

    return { def.oid, def.Get( "DESC" ), def.Extensions() };
  }

  auto  ParseMatchingRule( const std::string_view& str ) -> MatchingRule
  {
    auto  def = ParseDefinition( str );
    auto  out = MatchingRule();

    out.oid = def.oid;
    out.names = def.List( "NAME" );
    out.desc = def.Get( "DESC" );
    out.obsolete = def.Has( "OBSOLETE" );
    out.syntaxOid = def.Get( "SYNTAX" );
    out.extensions = def.Extensions();

    if ( out.syntaxOid.empty() )
      throw ParseError( mtc::strprintf( "matching rule '%s' has no SYNTAX", out.oid.c_str() ) );

    return out;
  }

  auto  ParseMatchingRuleUse( const std::string_view& str ) -> MatchingRuleUse
  {
    auto  def = ParseDefinition( str );
    auto  out = MatchingRuleUse();

    out.oid = def.oid;
    out.names = def.List( "NAME" );
    out.desc = def.Get( "DESC" );
    out.obsolete = def.Has( "OBSOLETE" );
    out.applies = def.List( "APPLIES" );
    out.extensions = def.Extensions();

    return out;
  }

  // Schema implementation

  template <class Descriptor>
  struct Catalog
  {
    std::vector<Descriptor>                 items;
    std::unordered_map<std::string, size_t> index;

    void  Add( Descriptor&& );
    auto  Get( const std::string_view& ) const -> const Descriptor*;
    auto  Get( const std::string_view& ) -> Descriptor*;
  };

  template <class Descriptor>
  void  Catalog<Descriptor>::Add( Descriptor&& item )
  {
    auto  pos = items.size();

    index[LowerCase( item.oid )] = pos;

    if constexpr ( !std::is_same<Descriptor, LdapSyntax>::value )
      for ( auto& name: item.names )
        index[LowerCase( name )] = pos;

    items.push_back( std::move( item ) );
  }

  template <class Descriptor>
  auto  Catalog<Descriptor>::Get( const std::string_view& key ) const -> const Descriptor*
  {
    auto  pfound = index.find( LowerCase( key ) );

    return pfound != index.end() ? &items[pfound->second] : nullptr;
  }

  template <class Descriptor>
  auto  Catalog<Descriptor>::Get( const std::string_view& key ) -> Descriptor*
  {
    auto  pfound = index.find( LowerCase( key ) );

    return pfound != index.end() ? &items[pfound->second] : nullptr;
  }

  struct Schema::impl
  {
    Catalog<ObjectClass>      objectClasses;
    Catalog<AttributeType>    attributeTypes;
    Catalog<LdapSyntax>       ldapSyntaxes;
    Catalog<MatchingRule>     matchingRules;
    Catalog<MatchingRuleUse>  matchingRuleUse;

    void  ResolveClasses();
    void  ResolveAttributes();

  protected:
    enum: unsigned
    {
      unresolved = 0,
      inProgress = 1,
      resolved = 2
    };

    void  Resolve( ObjectClass&, std::vector<unsigned>& );
    void  Resolve( AttributeType&, std::vector<unsigned>& );

  };

  static  void  AddUnique( std::vector<std::string>& to, const std::vector<std::string>& from )
  {
    for ( auto& next: from )
    {
      auto  pfound = std::find_if( to.begin(), to.end(), [&]( const std::string& s )
        {  return EqualNoCase( s, next );  } );

      if ( pfound == to.end() )
        to.push_back( next );
    }
  }

  void  Schema::impl::Resolve( ObjectClass& oclass, std::vector<unsigned>& states )
  {
    auto& status = states[&oclass - objectClasses.items.data()];
    auto  newMust = std::vector<std::string>();
    auto  newMay = std::vector<std::string>();

    if ( status == resolved )
      return;
    if ( status == inProgress )
      throw SchemaCycle( mtc::strprintf( "object class '%s' inherits itself", oclass.GetName().c_str() ) );

    status = inProgress;

    for ( auto& supname: oclass.sup )
    {
      auto  superior = objectClasses.Get( supname );

      if ( superior == nullptr )
      {
        spdlog::warn( "[Schema] object class '{}' refers to unknown superior '{}'", oclass.GetName(), supname );
        continue;
      }

      Resolve( *superior, states );

      AddUnique( newMust, superior->must );
      AddUnique( newMay, superior->may );
    }

    AddUnique( newMust, oclass.declaredMust );
    AddUnique( newMay, oclass.declaredMay );

    oclass.must = std::move( newMust );
    oclass.may = std::move( newMay );

    status = resolved;
  }

  void  Schema::impl::Resolve( AttributeType& attype, std::vector<unsigned>& states )
  {
    auto& status = states[&attype - attributeTypes.items.data()];

    if ( status == resolved )
      return;
    if ( status == inProgress )
      throw SchemaCycle( mtc::strprintf( "attribute type '%s' inherits itself", attype.GetName().c_str() ) );

    status = inProgress;

    if ( !attype.sup.empty() )
    {
      auto  superior = attributeTypes.Get( attype.sup );

      if ( superior != nullptr )
      {
        Resolve( *superior, states );

        if ( attype.syntaxOid.empty() )
        {
          attype.syntaxOid = superior->syntaxOid;
          attype.syntaxLen = superior->syntaxLen;
        }
        if ( attype.equality.empty() )  attype.equality = superior->equality;
        if ( attype.ordering.empty() )  attype.ordering = superior->ordering;
        if ( attype.substr.empty() )    attype.substr = superior->substr;

        attype.singleValued |= superior->singleValued;
      }
        else
      spdlog::warn( "[Schema] attribute type '{}' refers to unknown superior '{}'", attype.GetName(), attype.sup );
    }

    status = resolved;
  }

  void  Schema::impl::ResolveClasses()
  {
    auto  states = std::vector<unsigned>( objectClasses.items.size(), unresolved );

    for ( auto& next: objectClasses.items )
      Resolve( next, states );
  }

  void  Schema::impl::ResolveAttributes()
  {
    auto  states = std::vector<unsigned>( attributeTypes.items.size(), unresolved );

    for ( auto& next: attributeTypes.items )
      Resolve( next, states );
  }

  auto  Schema::GetObjectClass( const std::string_view& key ) const -> const ObjectClass*
  {
    return data != nullptr ? data->objectClasses.Get( key ) : nullptr;
  }

  auto  Schema::GetAttributeType( const std::string_view& key ) const -> const AttributeType*
  {
    return data != nullptr ? data->attributeTypes.Get( key ) : nullptr;
  }

  auto  Schema::GetLdapSyntax( const std::string_view& key ) const -> const LdapSyntax*
  {
    return data != nullptr ? data->ldapSyntaxes.Get( key ) : nullptr;
  }

  auto  Schema::GetMatchingRule( const std::string_view& key ) const -> const MatchingRule*
  {
    return data != nullptr ? data->matchingRules.Get( key ) : nullptr;
  }

  auto  Schema::GetMatchingRuleUse( const std::string_view& key ) const -> const MatchingRuleUse*
  {
    return data != nullptr ? data->matchingRuleUse.Get( key ) : nullptr;
  }

  auto  Schema::ListObjectClasses() const -> std::vector<const ObjectClass*>
  {
    auto  output = std::vector<const ObjectClass*>();

    if ( data != nullptr )
      for ( auto& next: data->objectClasses.items )
        output.push_back( &next );
    return output;
  }

  auto  Schema::ListAttributeTypes() const -> std::vector<const AttributeType*>
  {
    auto  output = std::vector<const AttributeType*>();

    if ( data != nullptr )
      for ( auto& next: data->attributeTypes.items )
        output.push_back( &next );
    return output;
  }

  bool  Schema::empty() const
  {
    return data == nullptr || (data->objectClasses.items.empty() && data->attributeTypes.items.empty());
  }

  // ParseSchema implementation

  template <class Descriptor, class Parser>
  static  void  LoadDefinitions( Catalog<Descriptor>& catalog, const mtc::zmap& dump, const char* key, Parser parse )
  {
    auto  pvalue = FindAttribute( dump, key );

    if ( pvalue != nullptr )
      for ( auto& next: GetStrings( *pvalue ) )
        catalog.Add( parse( next ) );
  }

  auto  ParseSchema( const mtc::zmap& dump ) -> Schema
  {
    auto  parsed = std::make_shared<Schema::impl>();
    auto  schema = Schema();

    LoadDefinitions( parsed->ldapSyntaxes, dump, "ldapSyntaxes", ParseLdapSyntax );
    LoadDefinitions( parsed->matchingRules, dump, "matchingRules", ParseMatchingRule );
    LoadDefinitions( parsed->matchingRuleUse, dump, "matchingRuleUse", ParseMatchingRuleUse );
    LoadDefinitions( parsed->attributeTypes, dump, "attributeTypes", ParseAttributeType );
    LoadDefinitions( parsed->objectClasses, dump, "objectClasses", ParseObjectClass );

    parsed->ResolveAttributes();
    parsed->ResolveClasses();

    spdlog::debug( "[Schema] loaded {} object classes, {} attribute types",
      parsed->objectClasses.items.size(), parsed->attributeTypes.items.size() );

    schema.data = std::move( parsed );
    return schema;
  }

}}
