// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#pragma once

#include "beeres_def.hpp"
#include "beeres_exception.hpp"
#include "beeres_helpers.hpp"
#include "beeres_list.hpp"
