# include "../directory.hpp"
# include "value-tools.hpp"
# include "../compat.hpp"
# include <spdlog/spdlog.h>
# include <mtc/wcsstr.h>
# include <cstdlib>
# include <cerrno>
# include <map>

namespace arbor {

  const char integerSyntaxOid[] = "1.3.6.1.4.1.1466.115.121.1.27";

  // Scope implementation

  auto  Scope::Parse( const std::string_view& str ) -> unsigned
  {
    if ( EqualNoCase( str, "base" ) )
      return base;
    if ( EqualNoCase( str, "one" ) || EqualNoCase( str, "onelevel" ) )
      return onelevel;
    if ( EqualNoCase( str, "sub" ) || EqualNoCase( str, "subtree" ) )
      return subtree;
    return unknown;
  }

  auto  Scope::to_string( unsigned scope ) -> const char*
  {
    switch ( scope )
    {
      case base:      return "base";
      case onelevel:  return "one";
      case subtree:   return "sub";
      default:        return "unknown";
    }
  }

  // decoders

  auto  DecodeInteger( const std::string& str ) -> mtc::zval
  {
    char*   endptr;
    long long result;

    errno = 0;
    result = strtoll( str.c_str(), &endptr, 10 );

    if ( str.empty() || *endptr != '\0' || errno == ERANGE )
    {
      spdlog::warn( "[Directory] invalid integer value '{}' kept as string", str );
      return mtc::zval( str );
    }
    return mtc::zval( int64_t(result) );
  }

  // Directory implementation

  struct Directory::impl
  {
    mtc::api<IDirectory>                      client;
    bool                                      loaded = false;
    schema::Schema                            schema;
    std::vector<mtc::api<const IControl>>     controls;
    std::map<std::string, Decoder>            decoders;

    impl( mtc::api<IDirectory> );

    auto  LoadSchema() -> const schema::Schema&;
  };

  Directory::impl::impl( mtc::api<IDirectory> dir ):
    client( dir ),
    controls( dir->GetControls() )
  {
    decoders.insert( { integerSyntaxOid, DecodeInteger } );
  }

  auto  Directory::impl::LoadSchema() -> const schema::Schema&
  {
    if ( !loaded )
    {
      spdlog::debug( "[Directory] loading schema" );
      schema = schema::ParseSchema( client->GetSchema() );
      loaded = true;
    }
    return schema;
  }

  Directory::Directory( mtc::api<IDirectory> dir )
  {
    if ( dir == nullptr )
      throw std::invalid_argument( "directory interface must not be null" );
    data = std::make_shared<impl>( dir );
  }

  auto  Directory::GetBaseDn() const -> std::string
  {
    return ptr()->GetBaseDn();
  }

  auto  Directory::GetSchema() const -> const schema::Schema&
  {
    if ( data == nullptr )
      throw std::logic_error( "directory is not initialized @" __FILE__ ":" LINE_STRING );
    return data->LoadSchema();
  }

  auto  Directory::GetControls() const -> const std::vector<mtc::api<const IControl>>&
  {
    static const std::vector<mtc::api<const IControl>> none;

    return data != nullptr ? data->controls : none;
  }

  auto  Directory::GetControl( const std::string_view& oid ) const -> mtc::api<const IControl>
  {
    for ( auto& next: GetControls() )
      if ( next->GetOid() == oid )
        return next;
    return nullptr;
  }

  auto  Directory::SetSchema( const schema::Schema& schema ) -> Directory&
  {
    if ( data == nullptr )
      throw std::logic_error( "directory is not initialized @" __FILE__ ":" LINE_STRING );
    data->schema = schema;
    data->loaded = true;
    return *this;
  }

  auto  Directory::SetDecoder( const std::string& syntaxOid, Decoder decoder ) -> Directory&
  {
    if ( data == nullptr )
      throw std::logic_error( "directory is not initialized @" __FILE__ ":" LINE_STRING );
    if ( decoder != nullptr ) data->decoders[syntaxOid] = decoder;
      else data->decoders.erase( syntaxOid );
    return *this;
  }

  auto  Directory::Decode( const std::string_view& attr, const std::vector<std::string>& values ) const -> mtc::zval
  {
    auto  attype = GetSchema().GetAttributeType( attr );

    if ( attype == nullptr )
    {
      spdlog::info( "[Directory] no attributeType found for '{}'", attr );
      return {};
    }

    auto  pfound = data->decoders.find( attype->syntaxOid );
    auto  decode = [&]( const std::string& s ) -> mtc::zval
      {  return pfound != data->decoders.end() ? pfound->second( s ) : mtc::zval( s );  };

    if ( attype->singleValued )
      return values.empty() ? mtc::zval() : decode( values.front() );

    auto  output = mtc::array_zval();

    for ( auto& next: values )
      output.push_back( decode( next ) );

    return mtc::zval( std::move( output ) );
  }

  void  Directory::Search( const std::string& base, unsigned scope, const std::string& filter,
    const SearchParams& params, const IDirectory::Receiver& receiver ) const
  {
    spdlog::debug( "[Directory] search base='{}' scope={} filter='{}' limit={}",
      base, Scope::to_string( scope ), filter, params.limit );
    ptr()->Search( base, scope, filter, params, receiver );
  }

  auto  Directory::GetEntry( const std::string& dn, bool operational ) const -> mtc::zmap
  {
    spdlog::debug( "[Directory] fetching entry '{}'", dn );

    auto  entry = ptr()->GetEntry( dn, operational );

    if ( entry.empty() )
      throw NotFound( mtc::strprintf( "entry '%s' not found", dn.c_str() ) );
    return entry;
  }

  void  Directory::Modify( const std::string& dn, const mtc::zmap& mods ) const
  {
    spdlog::debug( "[Directory] modify '{}'", dn );
    ptr()->Modify( dn, mods );
  }

  void  Directory::Create( const std::string& dn, const mtc::zmap& attrs ) const
  {
    spdlog::debug( "[Directory] create '{}'", dn );
    ptr()->Create( dn, attrs );
  }

  void  Directory::Delete( const std::string& dn ) const
  {
    spdlog::debug( "[Directory] delete '{}'", dn );
    ptr()->Delete( dn );
  }

  void  Directory::DeleteValues( const std::string& dn, const mtc::zmap& attrs ) const
  {
    spdlog::debug( "[Directory] delete values of '{}'", dn );
    ptr()->DeleteValues( dn, attrs );
  }

  void  Directory::Move( const std::string& dn, const std::string& newRdn, const mtc::zmap& attrs ) const
  {
    spdlog::debug( "[Directory] move '{}' to '{}'", dn, newRdn );
    ptr()->Move( dn, newRdn, attrs );
  }

  void  Directory::Copy( const std::string& dn, const std::string& newDn, const mtc::zmap& attrs ) const
  {
    spdlog::debug( "[Directory] copy '{}' to '{}'", dn, newDn );
    ptr()->Copy( dn, newDn, attrs );
  }

  auto  Directory::ptr() const -> IDirectory*
  {
    if ( data == nullptr )
      throw std::logic_error( "directory is not initialized @" __FILE__ ":" LINE_STRING );
    return data->client.ptr();
  }

}
