#pragma once

int cmd_build(int argc, char** argv);
