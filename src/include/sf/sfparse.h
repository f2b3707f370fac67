// Umbrella header for the sfparse library
#pragma once

#include <sf/error.h>
#include <sf/ordered_map.h>
#include <sf/types.h>
#include <sf/cursor.h>
#include <sf/bare_item.h>
#include <sf/parser.h>
#include <sf/serializer.h>
#include <sf/encoding.h>
#include <sf/json.h>
