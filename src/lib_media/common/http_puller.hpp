#pragma once

#include "lib_captioner/collaborators.hpp"
#include <memory>

namespace Media {

std::unique_ptr<Captioner::IFilePuller> createHttpSource();

}
