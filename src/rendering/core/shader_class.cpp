#include "shader_class.h"
#include <fstream>
#include <iostream>
#include <stdexcept>

// Reads a text file and outputs a string with everything in the text file
std::string get_file_contents(const char* filename)
{
	// Try a set of common base path prefixes to be resilient to working directory
	// differences (e.g., running from build/tests vs project root)
	const char* prefixes[] = { "", "../", "../../", "../../../" };

	for (const char* prefix : prefixes)
	{
		std::string candidatePath = std::string(prefix) + filename;
		std::ifstream file(candidatePath.c_str(), std::ios::binary);
		if (file)
		{
			std::string contents;
			file.seekg(0, std::ios::end);
			contents.resize(static_cast<size_t>(file.tellg()));
			file.seekg(0, std::ios::beg);
			file.read(&contents[0], contents.size());
			file.close();
			return contents;
		}
	}

	// If this point is reached, then the file could not be opened
	std::cerr << "ERROR::SHADER::FILE_NOT_FOUND: " << filename << "\n";
	throw std::runtime_error(std::string("Shader file not found: ") + filename);
}

// Constructor for compute shader
Shader::Shader(const char* computeFile)
{
	int success;
	char infoLog[512];

	// Read computeFile and store the string
	std::string computeCode = get_file_contents(computeFile);
	const char* computeSource = computeCode.c_str();

	// Create Compute Shader Object and get its reference
	GLuint computeShader = glCreateShader(GL_COMPUTE_SHADER);
	// Attach Compute Shader source to the Compute Shader Object
	glShaderSource(computeShader, 1, &computeSource, NULL);
	// Compile the Compute Shader into machine code
	glCompileShader(computeShader);
	// Report compile errors if any
	glGetShaderiv(computeShader, GL_COMPILE_STATUS, &success);
	if (!success)
	{
		glGetShaderInfoLog(computeShader, 512, NULL, infoLog);
		glDeleteShader(computeShader);
		std::cerr << "ERROR::SHADER::COMPUTE::COMPILATION_FAILED " << computeFile << "\n" << infoLog << "\n";
		throw std::runtime_error(std::string("Compute shader compilation failed: ") + computeFile);
	}

	// Create Shader Program Object and get its reference
	ID = glCreateProgram();
	// Attach the Compute Shader to the Shader Program
	glAttachShader(ID, computeShader);
	// Link the shader program
	glLinkProgram(ID);
	// destroy the now useless Compute Shader object
	glDeleteShader(computeShader);

	// Report linking errors if any
	glGetProgramiv(ID, GL_LINK_STATUS, &success);
	if (!success)
	{
		glGetProgramInfoLog(ID, 512, NULL, infoLog);
		destroy();
		std::cerr << "ERROR::SHADER::COMPUTE_PROGRAM::LINKING_FAILED " << computeFile << "\n" << infoLog << "\n";
		throw std::runtime_error(std::string("Compute program linking failed: ") + computeFile);
	}
}

Shader::~Shader()
{
	destroy();
}

// Activates the Shader Program
void Shader::use() const
{
	glUseProgram(ID);
}

// Deletes the Shader Program
void Shader::destroy()
{
	if (ID) glDeleteProgram(ID);
	ID = 0;
}

// Dispatch compute shader
void Shader::dispatch(GLuint num_groups_x, GLuint num_groups_y, GLuint num_groups_z) const
{
	glDispatchCompute(num_groups_x, num_groups_y, num_groups_z);
}

GLuint Shader::getLocalSizeX() const
{
	GLint localSize[3] = { 0, 0, 0 };
	glGetProgramiv(ID, GL_COMPUTE_WORK_GROUP_SIZE, localSize);
	return static_cast<GLuint>(localSize[0]);
}
