# if !defined( __arbor_tests_toolbox_directory_stub_h__ )
# define __arbor_tests_toolbox_directory_stub_h__
# include "../../directory.hpp"
# include <map>

extern const char testBaseDn[];
extern const char testPeopleDn[];
extern const char testHostsDn[];
extern const char testSubHostsDn[];
extern const char testRoomsDn[];
extern const char testPersonDn[];
extern const char testHostDn[];

/*
 * DirectoryStub
 *
 * In-memory directory; searches select entries by base and scope only,
 * the filter text is recorded and not evaluated.
 */
class DirectoryStub final: public arbor::IDirectory
{
  implement_lifetime_control

public:
  struct SearchCall
  {
    std::string         base;
    unsigned            scope;
    std::string         filter;
    arbor::SearchParams params;
  };

public:
  DirectoryStub( const std::string& baseDn = testBaseDn );

  auto  AddEntry( const std::string& dn, const mtc::zmap& ) -> DirectoryStub&;
  auto  AddControl( mtc::api<const arbor::IControl> ) -> DirectoryStub&;
  auto  Find( const std::string& dn ) const -> const mtc::zmap*;

public:
  auto  GetBaseDn() const -> std::string override  {  return baseDn;  }
  auto  GetSchema() const -> mtc::zmap override;
  auto  GetControls() const -> std::vector<mtc::api<const arbor::IControl>> override  {  return controls;  }

  void  Search( const std::string&, unsigned, const std::string&,
    const arbor::SearchParams&, const Receiver& ) override;
  auto  GetEntry( const std::string&, bool ) -> mtc::zmap override;

  void  Modify( const std::string&, const mtc::zmap& ) override;
  void  Create( const std::string&, const mtc::zmap& ) override;
  void  Delete( const std::string& ) override;
  void  DeleteValues( const std::string&, const mtc::zmap& ) override;
  void  Move( const std::string&, const std::string&, const mtc::zmap& ) override;
  void  Copy( const std::string&, const std::string&, const mtc::zmap& ) override;

public:
  std::string                                     baseDn;
  std::map<std::string, mtc::zmap>                entries;
  std::vector<mtc::api<const arbor::IControl>>    controls;
  std::vector<SearchCall>                         searches;
  std::vector<std::string>                        fetched;
  std::vector<std::string>                        modified;
  mutable unsigned                                schemaLoads = 0;
  bool                                            failWrites = false;

};

/*
 * CreateTestDirectory()
 *
 * Stub directory with the test schema and the acme.com tree:
 *   ou=people with two persons, ou=hosts with the router and ou=subhosts
 *   holding the laptop, ou=rooms with the boardroom.
 */
auto  CreateTestDirectory() -> mtc::api<DirectoryStub>;

# endif // !__arbor_tests_toolbox_directory_stub_h__
