#pragma once
#include "statements.hpp"
#include "module.hpp"
