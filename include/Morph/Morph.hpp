#pragma once

// Morph - typed component lifecycle accessors over a small ECS world
// This header includes all Morph headers in the correct dependency order

// Core headers - fundamental types and utilities
#include "Core/Base.hpp"
#include "Core/Version.hpp"
#include "Platform/Platform.hpp"

// Core utilities
#include "Core/Config.hpp"
#include "Core/Error.hpp"
#include "Core/Result.hpp"
#include "Core/TypeID.hpp"
#include "Core/Profile.hpp"
#include "Core/Log.hpp"

// Container types
#include "Container/Bitmap.hpp"

// Entity system
#include "Entity/Entity.hpp"
#include "Entity/EntityIDStack.hpp"

// Component system
#include "Component/Component.hpp"
#include "Component/ComponentPool.hpp"
#include "Component/ComponentStorage.hpp"

// World and structural mutation
#include "World/CompositionTable.hpp"
#include "World/Flyweight.hpp"
#include "World/World.hpp"
#include "World/Transmuter.hpp"

// Accessors
#include "Accessor/IComponentAccessor.hpp"
#include "Accessor/ComponentAccessor.hpp"
