#ifndef JCX_DIVAN_FINDER_EXECUTOR_H
#define JCX_DIVAN_FINDER_EXECUTOR_H

#include <string>
#include <utility>
#include <vector>

#include "jcailloux/divan/io/Task.h"
#include "jcailloux/divan/view/FinderSpec.h"

namespace jcailloux::divan {

/// Capability interface for running declared finders by name.
/// Lets callers hold finders without knowing the accessor's template arguments.
template<typename Entity>
class FinderExecutor {
public:
    virtual ~FinderExecutor() = default;

    virtual io::Task<std::vector<Entity>> invokeFinder(std::string name, view::FinderArgs args) = 0;

    io::Task<std::vector<Entity>> invokeFinder(std::string name) {
        return invokeFinder(std::move(name), view::FinderArgs{});
    }
};

}  // namespace jcailloux::divan

#endif  // JCX_DIVAN_FINDER_EXECUTOR_H
