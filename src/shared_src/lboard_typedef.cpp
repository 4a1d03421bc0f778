/*
 * lboard_typedef.cpp
 *
 *  Created on: 2019年4月2日
 *      Author: peter
 */

#include "lboard_typedef.hpp"

#include <stdexcept>

namespace lboard
{

	job_status parse_job_status(const std::string & name)
	{
		for (job_status status : {job_status::REGISTERING, job_status::PENDING, job_status::RUNNING}) {
			if (name == get_job_status_name(status)) {
				return status;
			}
		}
		throw std::invalid_argument("unknown job status: " + name);
	}

	run_outcome parse_run_outcome(const std::string & name)
	{
		for (run_outcome outcome : {run_outcome::SUCCESS, run_outcome::ERROR}) {
			if (name == get_run_outcome_name(outcome)) {
				return outcome;
			}
		}
		throw std::invalid_argument("unknown run outcome: " + name);
	}

	llm_backend parse_llm_backend(const std::string & name)
	{
		for (llm_backend backend : {llm_backend::OLLAMA, llm_backend::OPENAI}) {
			if (name == get_llm_backend_name(backend)) {
				return backend;
			}
		}
		throw std::invalid_argument("unknown LLM client backend: " + name + " (expected ollama or openai)");
	}

} /* namespace lboard */
