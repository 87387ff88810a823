#include "register_types.h"
#include "xiangqi_agent.h"
#include "xiangqi_board.h"
#include "../log.h"

#include <gdextension_interface.h>
#include <godot_cpp/core/defs.hpp>
#include <godot_cpp/godot.hpp>
#include <godot_cpp/variant/utility_functions.hpp>

using namespace godot;

// Routes core log lines to the editor output
static void forward_log_to_godot(xiangqi::LogLevel level, const std::string &message) {
    String text = String::utf8(message.c_str());
    switch (level) {
        case xiangqi::LOG_VERBOSE: UtilityFunctions::print_verbose(text); break;
        case xiangqi::LOG_INFO:    UtilityFunctions::print(text); break;
        case xiangqi::LOG_WARNING: UtilityFunctions::push_warning(text); break;
        case xiangqi::LOG_ERROR:   UtilityFunctions::push_error(text); break;
    }
}

void initialize_xiangqi_module(ModuleInitializationLevel p_level) {
    if (p_level != MODULE_INITIALIZATION_LEVEL_SCENE) {
        return;
    }

    xiangqi::set_log_sink(&forward_log_to_godot);

    GDREGISTER_CLASS(XiangqiBoard);
    GDREGISTER_CLASS(XiangqiAgent);
}

void uninitialize_xiangqi_module(ModuleInitializationLevel p_level) {
    if (p_level != MODULE_INITIALIZATION_LEVEL_SCENE) {
        return;
    }

    xiangqi::set_log_sink(nullptr);
}

extern "C" {

GDExtensionBool GDE_EXPORT xiangqi_library_init(GDExtensionInterfaceGetProcAddress p_get_proc_address,
                                                const GDExtensionClassLibraryPtr p_library,
                                                GDExtensionInitialization *r_initialization) {
    godot::GDExtensionBinding::InitObject init_obj(p_get_proc_address, p_library, r_initialization);

    init_obj.register_initializer(initialize_xiangqi_module);
    init_obj.register_terminator(uninitialize_xiangqi_module);
    init_obj.set_minimum_library_initialization_level(MODULE_INITIALIZATION_LEVEL_SCENE);

    return init_obj.init();
}

}
