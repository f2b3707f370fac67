// Render parsed structured fields as JSON in the layout used by the public
// structured-field conformance fixtures:
//   item        -> [bare_item, {parameters}]
//   inner list  -> [[item, ...], {parameters}]
//   list        -> [member, ...]
//   dictionary  -> {"key": member, ...}
//   token       -> {"__type": "token", "value": "..."}
//   byte seq.   -> {"__type": "binary", "value": "<base32>"}
#pragma once

#include <sf/types.h>
#include <string>

namespace sf {

std::string to_json(const BareItem& item);
std::string to_json(const Parameters& params);
std::string to_json(const Item& item);
std::string to_json(const InnerList& list);
std::string to_json(const ItemOrInnerList& member);
std::string to_json(const List& list);
std::string to_json(const Dictionary& dict);

}  // namespace sf
