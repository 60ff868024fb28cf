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

#include <config.h>

#include <scal/common/PropertyTree.hpp>

#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>

#include <cstddef>
#include <istream>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace Scal {

PropertyTree::PropertyTree()
    : tree_(std::make_unique<boost::property_tree::ptree>())
{}

PropertyTree::PropertyTree(const std::string& jsonFile)
    : tree_(std::make_unique<boost::property_tree::ptree>())
{
    boost::property_tree::read_json(jsonFile, *tree_);
}

PropertyTree::PropertyTree(std::istream& jsonStream)
    : tree_(std::make_unique<boost::property_tree::ptree>())
{
    boost::property_tree::read_json(jsonStream, *tree_);
}

PropertyTree::PropertyTree(const PropertyTree& tree)
    : tree_(std::make_unique<boost::property_tree::ptree>(*tree.tree_))
{}

PropertyTree::PropertyTree(const boost::property_tree::ptree& tree)
    : tree_(std::make_unique<boost::property_tree::ptree>(tree))
{}

PropertyTree::~PropertyTree() = default;

PropertyTree& PropertyTree::operator=(const PropertyTree& tree)
{
    *tree_ = *tree.tree_;
    return *this;
}

template <class T>
void PropertyTree::put(const std::string& key, const T& value)
{
    tree_->put(key, value);
}

template <class T>
T PropertyTree::get(const std::string& key) const
{
    return tree_->get<T>(key);
}

template <class T>
T PropertyTree::get(const std::string& key, const T& defValue) const
{
    return tree_->get(key, defValue);
}

PropertyTree PropertyTree::get_child(const std::string& key) const
{
    auto pt = tree_->get_child(key);

    return PropertyTree(pt);
}

std::optional<PropertyTree>
PropertyTree::get_child_optional(const std::string& key) const
{
    auto pt = tree_->get_child_optional(key);
    if (! pt) {
        return std::nullopt;
    }

    return PropertyTree(pt.get());
}

std::vector<std::string> PropertyTree::get_child_keys() const
{
    auto keys = std::vector<std::string>{};
    keys.reserve(tree_->size());

    for (const auto& child : *tree_) {
        keys.push_back(child.first);
    }

    return keys;
}

bool PropertyTree::has_child(const std::string& key) const
{
    return tree_->find(key) != tree_->not_found();
}

void PropertyTree::write_json(std::ostream& os, bool pretty) const
{
    boost::property_tree::write_json(os, *tree_, pretty);
}

template void PropertyTree::put(const std::string& key, const std::string& value);
template void PropertyTree::put(const std::string& key, const double& value);
template void PropertyTree::put(const std::string& key, const int& value);
template void PropertyTree::put(const std::string& key, const std::size_t& value);
template void PropertyTree::put(const std::string& key, const bool& value);

template std::string PropertyTree::get<std::string>(const std::string& key) const;
template double PropertyTree::get<double>(const std::string& key) const;
template int PropertyTree::get<int>(const std::string& key) const;
template std::size_t PropertyTree::get<std::size_t>(const std::string& key) const;
template bool PropertyTree::get<bool>(const std::string& key) const;

template std::string PropertyTree::get<std::string>(const std::string& key, const std::string& defValue) const;
template double PropertyTree::get<double>(const std::string& key, const double& defValue) const;
template int PropertyTree::get<int>(const std::string& key, const int& defValue) const;
template std::size_t PropertyTree::get<std::size_t>(const std::string& key, const std::size_t& defValue) const;
template bool PropertyTree::get<bool>(const std::string& key, const bool& defValue) const;

} // namespace Scal
