#pragma once

#include <glad/glad.h>
#include <string>


// Reads a text file, trying a few parent directories so binaries can run from a build tree.
// Throws std::runtime_error when the file cannot be found.
std::string get_file_contents(const char* filename);

// Compute shader program
class Shader
{
public:
	// Reference ID of the Shader Program
	GLuint ID = 0;

	// Compiles and links the compute shader. Throws std::runtime_error with the info log on failure.
	explicit Shader(const char* computeFile);
	~Shader();

	Shader(const Shader&) = delete;
	Shader& operator=(const Shader&) = delete;

	// Activates the Shader Program
	void use() const;
	// Deletes the Shader Program
	void destroy();
	// Dispatch compute shader
	void dispatch(GLuint num_groups_x, GLuint num_groups_y = 1, GLuint num_groups_z = 1) const;

	// Local size declared by the shader (layout(local_size_x = ...))
	GLuint getLocalSizeX() const;
};
