// ForeignImpl.hpp — handle to a class that lives in another translation unit
#pragma once

#include <NGIN/Hierarchy/Hierarchy.hpp>

#include "Zoo.hpp"

namespace IdentityDemo
{
  // Borrowed handle to ForeignImpl.cpp's file-local Impl, upcast to Animal.
  NGIN::Hierarchy::Handle<Zoo::Animal *> ForeignImplAsAnimal();
} // namespace IdentityDemo
