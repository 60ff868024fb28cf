/*
  This file is part of the Open Porous Media project (OPM).

  OPM is free software: you can redistribute it and/or modify
  it under the terms of the GNU General Public License as published by
  the Free Software Foundation, either version 3 of the License, or
  (at your option) any later version.

  OPM is distributed in the hope that it will be useful,
  but WITHOUT ANY WARRANTY; without even the implied warranty of
  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
  GNU General Public License for more details.

  You should have received a copy of the GNU General Public License
  along with OPM.  If not, see <http://www.gnu.org/licenses/>.
*/

#ifndef SCAL_PROPERTYTREE_HEADER_INCLUDED
#define SCAL_PROPERTYTREE_HEADER_INCLUDED

#include <functional>
#include <iosfwd>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace boost::property_tree {
    template <class Key, class Data, class KeyCompare>
    class basic_ptree;

    using ptree = basic_ptree<std::string, std::string, std::less<std::string>>;
} // namespace boost::property_tree

namespace Scal {

/// Hierarchical collection of key/value pairs.  Used for run-time
/// configuration, e.g., per-column monotonicity settings read from JSON.
class PropertyTree
{
public:
    /// Empty tree.
    PropertyTree();

    /// Tree initialised from the contents of a JSON file.
    explicit PropertyTree(const std::string& jsonFile);

    /// Tree initialised from a JSON document on an input stream.
    explicit PropertyTree(std::istream& jsonStream);

    PropertyTree(const PropertyTree& tree);
    ~PropertyTree();

    PropertyTree& operator=(const PropertyTree& tree);

    template <class T>
    void put(const std::string& key, const T& data);

    template <class T>
    T get(const std::string& key) const;

    template <class T>
    T get(const std::string& key, const T& defValue) const;

    PropertyTree get_child(const std::string& key) const;

    std::optional<PropertyTree> get_child_optional(const std::string& key) const;

    /// Names of the immediate children of this node, in document order.
    std::vector<std::string> get_child_keys() const;

    /// Whether or not this node has an immediate child named 'key'.
    bool has_child(const std::string& key) const;

    void write_json(std::ostream& os, bool pretty) const;

protected:
    explicit PropertyTree(const boost::property_tree::ptree& tree);

    std::unique_ptr<boost::property_tree::ptree> tree_;
};

} // namespace Scal

#endif // SCAL_PROPERTYTREE_HEADER_INCLUDED
