#pragma once

void init_logging(bool verbose);
