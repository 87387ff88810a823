#ifndef XIANGQI_GODOT_REGISTER_TYPES_H
#define XIANGQI_GODOT_REGISTER_TYPES_H

#include <godot_cpp/core/class_db.hpp>

using namespace godot;

void initialize_xiangqi_module(ModuleInitializationLevel p_level);
void uninitialize_xiangqi_module(ModuleInitializationLevel p_level);

#endif // XIANGQI_GODOT_REGISTER_TYPES_H
