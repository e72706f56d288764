// Public header for the jvariant library
#pragma once

#include <jv/errors.h>
#include <jv/value.h>
#include <jv/json.h>
#include <jv/json_type.h>
#include <jv/target.h>
#include <jv/payload.h>
#include <jv/pool.h>
