#ifndef CLAN_CLAN_H
#define CLAN_CLAN_H

#include "options.h"
#include "entity_id.h"
#include "component_registry.h"
#include "entity.h"
#include "family.h"
#include "system.h"
#include "engine.h"
#include "iterating_system.h"

#endif // !CLAN_CLAN_H
