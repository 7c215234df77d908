#pragma once

#include <opencm_model/model.hpp>

namespace opencm_loaders {

// Porter's Five Forces as an OpenCM model. Passes validation.
opencm_model::Model generate_sample_model();

} // namespace opencm_loaders
