#pragma once

int cmd_areas(int argc, char** argv);
