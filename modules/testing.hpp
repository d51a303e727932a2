#pragma once

namespace switchyard
{
class ActionRegistry;

namespace modules
{
// Testing.index, Testing.echo
void register_testing(ActionRegistry& registry);
}
}
