#include "image_loader.h"

#define STB_IMAGE_IMPLEMENTATION
#include "errors.h"
#include "logger.h"
#include "stb_image.h"

namespace ShapeKit {

	Field LoadGrayscaleImage(const std::string& path) {
		int            width, height, nrComponents;
		unsigned char* data = stbi_load(path.c_str(), &width, &height, &nrComponents, 0);
		if (!data) {
			const char* reason = stbi_failure_reason();
			throw ConfigurationError(
				"custom image '" + path + "' could not be read" + (reason ? std::string(": ") + reason : std::string())
			);
		}

		// Gray+alpha and RGBA carry alpha in the last channel.
		const int color = (nrComponents == 2 || nrComponents == 4) ? nrComponents - 1 : nrComponents;

		Field image(height, width);
		for (int r = 0; r < height; ++r) {
			const unsigned char* row = data + static_cast<size_t>(r) * width * nrComponents;
			for (int c = 0; c < width; ++c) {
				double sum = 0.0;
				for (int k = 0; k < color; ++k)
					sum += row[c * nrComponents + k];
				image(height - 1 - r, c) = sum / (255.0 * color);
			}
		}
		stbi_image_free(data);

		logger::LOG("Custom image loaded: {} ({}x{}, {} channels)", path, width, height, nrComponents);
		return image;
	}

} // namespace ShapeKit
