#pragma once

#include "log.hpp"
#include "types.hpp"
#include "db.hpp"
#include "schema.hpp"
#include "type_mapper.hpp"
#include "observation.hpp"
#include "view_model.hpp"
#include "repository.hpp"
#include "observable_collection.hpp"
#include "choices.hpp"
#include "edit_session.hpp"
#include "configuration.hpp"
