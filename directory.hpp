# if !defined( __arbor_directory_hpp__ )
# define __arbor_directory_hpp__
# include "exceptions.hpp"
# include "schema.hpp"
# include <mtc/interfaces.h>
# include <mtc/zmap.h>
# include <string_view>
# include <functional>
# include <memory>
# include <string>
# include <vector>

namespace arbor {

  struct Scope
  {
    enum: unsigned
    {
      base = 0,
      onelevel = 1,
      subtree = 2,
      unknown = unsigned(-1)
    };

   /*
    * Parse()
    *
    * Accepts 'base', 'one', 'onelevel', 'sub' and 'subtree' in any case,
    * returns Scope::unknown for anything else.
    */
    static  auto  Parse( const std::string_view& ) -> unsigned;
    static  auto  to_string( unsigned ) -> const char*;
  };

  struct Control
  {
    std::string oid;
    std::string value;
    bool        critical = false;

    bool  operator == ( const Control& c ) const
      {  return oid == c.oid && value == c.value && critical == c.critical;  }
  };

  struct SearchParams
  {
    unsigned                  limit = 0;          // 0 - unlimited
    std::vector<std::string>  selectattrs;        // empty - all attributes
    double                    timeout = 0;        // 0 - no timeout
    std::vector<Control>      clientControls;
    std::vector<Control>      serverControls;
  };

 /*
  * IControl
  *
  * Protocol extension control registered with the directory. Controls get
  * the query options and contribute client and server control payloads to
  * every search run from a branchset.
  */
  struct IControl: mtc::Iface
  {
    virtual auto  GetOid() const -> std::string = 0;
    virtual auto  GetClientControls( const mtc::zmap& options ) const -> std::vector<Control> = 0;
    virtual auto  GetServerControls( const mtc::zmap& options ) const -> std::vector<Control> = 0;
  };

 /*
  * IDirectory
  *
  * Directory service connection. Raw entries are zmaps mapping attribute
  * names to arrays of strings with the entry DN under the "dn" key.
  */
  struct IDirectory: mtc::Iface
  {
    using  Receiver = std::function<void( const mtc::zmap& )>;

    virtual auto  GetBaseDn() const -> std::string = 0;
    virtual auto  GetSchema() const -> mtc::zmap = 0;
    virtual auto  GetControls() const -> std::vector<mtc::api<const IControl>> = 0;

   /*
    * Search()
    *
    * Runs the search and passes each found entry to the receiver.
    */
    virtual void  Search( const std::string& base, unsigned scope, const std::string& filter,
      const SearchParams&, const Receiver& ) = 0;

   /*
    * GetEntry()
    *
    * Returns the entry, with operational attributes if requested; returns
    * empty zmap if there is no such entry.
    */
    virtual auto  GetEntry( const std::string& dn, bool operational ) -> mtc::zmap = 0;

    virtual void  Modify( const std::string& dn, const mtc::zmap& ) = 0;
    virtual void  Create( const std::string& dn, const mtc::zmap& ) = 0;
    virtual void  Delete( const std::string& dn ) = 0;
    virtual void  DeleteValues( const std::string& dn, const mtc::zmap& ) = 0;     // empty array deletes attribute
    virtual void  Move( const std::string& dn, const std::string& newRdn, const mtc::zmap& ) = 0;
    virtual void  Copy( const std::string& dn, const std::string& newDn, const mtc::zmap& ) = 0;
  };

 /*
  * Directory
  *
  * Shared handle to the directory connection. Keeps the parsed schema (loaded
  * on first use), the list of registered controls and the value decoders
  * keyed by syntax OID.
  */
  class Directory
  {
    struct impl;

    std::shared_ptr<impl> data;

  public:
    using Decoder = std::function<mtc::zval( const std::string& )>;

  public:
    Directory() = default;
    Directory( mtc::api<IDirectory> );

    auto  GetBaseDn() const -> std::string;
    auto  GetSchema() const -> const schema::Schema&;
    auto  GetControls() const -> const std::vector<mtc::api<const IControl>>&;
    auto  GetControl( const std::string_view& oid ) const -> mtc::api<const IControl>;

    auto  SetSchema( const schema::Schema& ) -> Directory&;
    auto  SetDecoder( const std::string& syntaxOid, Decoder ) -> Directory&;

   /*
    * Decode( attributeType, values )
    *
    * Converts raw values of the attribute to the typed ones. Attributes
    * declared SINGLE-VALUE produce the scalar, others produce array_zval.
    * Attributes not described by the schema are logged and decode to the
    * empty zval.
    */
    auto  Decode( const std::string_view& attr, const std::vector<std::string>& ) const -> mtc::zval;

    void  Search( const std::string& base, unsigned scope, const std::string& filter,
      const SearchParams&, const IDirectory::Receiver& ) const;
    auto  GetEntry( const std::string& dn, bool operational = false ) const -> mtc::zmap;     // throws NotFound

    void  Modify( const std::string& dn, const mtc::zmap& ) const;
    void  Create( const std::string& dn, const mtc::zmap& ) const;
    void  Delete( const std::string& dn ) const;
    void  DeleteValues( const std::string& dn, const mtc::zmap& ) const;
    void  Move( const std::string& dn, const std::string& newRdn, const mtc::zmap& ) const;
    void  Copy( const std::string& dn, const std::string& newDn, const mtc::zmap& ) const;

    auto  ptr() const -> IDirectory*;

    bool  operator == ( const Directory& d ) const  {  return data == d.data;  }
    bool  operator != ( const Directory& d ) const  {  return !(*this == d);  }

  };

  auto  DecodeInteger( const std::string& ) -> mtc::zval;

  extern const char integerSyntaxOid[];

}

# endif   // !__arbor_directory_hpp__
