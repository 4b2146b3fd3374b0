#pragma once

#include <harbor/ui/config.hpp>
#include <harbor/ui/divider_overlay.hpp>
#include <harbor/ui/drag_routing.hpp>
#include <harbor/ui/entry_table.hpp>
#include <harbor/ui/geometry.hpp>
#include <harbor/ui/hosted_view.hpp>
#include <harbor/ui/layout.hpp>
#include <harbor/ui/log.hpp>
#include <harbor/ui/mount.hpp>
#include <harbor/ui/node.hpp>
#include <harbor/ui/portal.hpp>
#include <harbor/ui/portal_host_view.hpp>
#include <harbor/ui/portal_registry.hpp>
#include <harbor/ui/reconciler.hpp>
#include <harbor/ui/render.hpp>
#include <harbor/ui/run_loop.hpp>
#include <harbor/ui/signal.hpp>
#include <harbor/ui/split_view.hpp>
#include <harbor/ui/view.hpp>
#include <harbor/ui/window.hpp>
