#pragma once

#include <sf/types.h>
#include <string>

namespace sf {

// Serialize to the canonical textual form of a structured field.
// Throws SerializeError if a value cannot be represented.
std::string dump_bare_item(const BareItem& item);
std::string dump_parameters(const Parameters& params);
std::string dump_item(const Item& item);
std::string dump_inner_list(const InnerList& list);
std::string dump_list(const List& list);
std::string dump_dictionary(const Dictionary& dict);

}  // namespace sf
