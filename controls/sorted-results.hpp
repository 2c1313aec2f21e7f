# if !defined( __arbor_controls_sorted_results_hpp__ )
# define __arbor_controls_sorted_results_hpp__
# include "../queries.hpp"

namespace arbor {
namespace controls {

  extern const char sortedResultsOid[];

  struct SortKey
  {
    std::string attr;
    std::string orderingRule;
    bool        reverse = false;
  };

 /*
  * CreateSortedResults()
  *
  * Server side sort request control; register it with the directory to
  * get the ordered search results from the servers supporting it.
  */
  auto  CreateSortedResults( bool critical = false ) -> mtc::api<const IControl>;

 /*
  * OrderBy( branchset, keys )
  *
  * Returns the branchset with the sort keys added. Keys are written as
  * 'attr', '-attr' for the reverse order, optionally followed by ':rule'
  * with the ordering matching rule.
  *
  * Throws std::invalid_argument if the directory has no sorted results
  * control registered or the key is not a single valid sort key.
  */
  auto  OrderBy( const queries::Branchset&, const std::vector<std::string>& ) -> queries::Branchset;
  auto  ParseSortKey( const std::string& ) -> SortKey;

  auto  EncodeSortKeys( const std::vector<SortKey>& ) -> std::string;

}}

# endif   // !__arbor_controls_sorted_results_hpp__
